#pragma once

/*
 * Presents a half-open interval [a,b) of integral values as a container.
 */

#include <cstddef>
#include <iterator>
#include <type_traits>

namespace dend {
namespace util {

template <typename V>
struct counter {
    using difference_type = std::ptrdiff_t;
    using value_type = V;
    using pointer = const V*;
    using reference = const V&;
    using iterator_category = std::random_access_iterator_tag;

    counter() = default;
    counter(V v): v_(v) {}

    counter& operator++() { ++v_; return *this; }
    counter operator++(int) { counter c(*this); ++v_; return c; }
    counter& operator--() { --v_; return *this; }
    counter operator--(int) { counter c(*this); --v_; return c; }

    counter& operator+=(difference_type n) { v_ += n; return *this; }
    counter& operator-=(difference_type n) { v_ -= n; return *this; }
    counter operator+(difference_type n) const { return counter(v_+n); }
    counter operator-(difference_type n) const { return counter(v_-n); }
    difference_type operator-(counter x) const { return difference_type(v_)-difference_type(x.v_); }

    const V& operator*() const { return v_; }
    V operator[](difference_type n) const { return v_+n; }

    bool operator==(counter x) const { return v_==x.v_; }
    bool operator!=(counter x) const { return v_!=x.v_; }
    bool operator<(counter x) const { return v_<x.v_; }

private:
    V v_ = V{};
};

template <typename V>
class span {
public:
    using value_type = V;
    using iterator = counter<V>;
    using const_iterator = counter<V>;
    using size_type = std::size_t;

    span() = default;
    span(V left, V right): left_(left), right_(right<left? left: right) {}

    iterator begin() const { return left_; }
    iterator end() const { return right_; }

    size_type size() const { return size_type(right_-left_); }
    bool empty() const { return left_==right_; }

    V front() const { return left_; }
    V back() const { return right_-1; }

    V operator[](size_type i) const { return left_+V(i); }

private:
    V left_ = V{};
    V right_ = V{};
};

template <typename I, typename J>
span<std::common_type_t<I, J>> make_span(I left, J right) {
    using V = std::common_type_t<I, J>;
    return span<V>(V(left), V(right));
}

template <typename I>
span<I> make_span(I right) {
    return span<I>(I{}, right);
}

// Span of valid indices into a sequence.
template <typename Seq>
auto count_along(const Seq& s) {
    return make_span(std::size(s));
}

} // namespace util
} // namespace dend
