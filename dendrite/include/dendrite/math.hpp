#pragma once

#include <cmath>

namespace dend {
namespace math {

template <typename T>
T constexpr pi = 3.1415926535897932384626433832795l;

template <typename T>
T constexpr square(T a) {
    return a*a;
}

template <typename T>
T constexpr cube(T a) {
    return a*a*a;
}

// Area of circle radius r.
template <typename T>
T constexpr area_circle(T r) {
    return pi<T> * square(r);
}

// Lateral surface area of a cylinder of radius r and length L,
// excluding the discs at each end.
template <typename T>
T constexpr area_cylinder(T L, T r) {
    return 2 * pi<T> * r * L;
}

// Linear interpolation by u in interval [a,b]: (1-u)*a + u*b.
template <typename T, typename U>
T constexpr lerp(T a, T b, U u) {
    return std::fma(T(u), b, std::fma(T(-u), a, a));
}

// x/(exp(x/y)-1) with the removable singularity at x == 0 filled in;
// the rate-function form that appears throughout Hodgkin-Huxley kinetics.
template <typename T>
T exprelr(T x, T y) {
    const T u = x/y;
    if (std::abs(u)<T(1e-6)) {
        return y*(T(1) - u/2);
    }
    return x/std::expm1(u);
}

} // namespace math
} // namespace dend
