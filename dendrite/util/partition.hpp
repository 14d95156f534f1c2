#pragma once

#include <iterator>

namespace dend {
namespace util {

// Fill `divisions` with the partial sums of `sizes`, starting at `from`:
// element i of the partition is the half-open interval
// [divisions[i], divisions[i+1]). Returns the end of the last interval.
template <typename Part, typename Sizes, typename T = typename Part::value_type>
T make_partition(Part& divisions, const Sizes& sizes, T from=T{}) {
    divisions.resize(std::size(sizes)+1);

    auto pi = std::begin(divisions);
    for (const auto& s: sizes) {
        *pi++ = from;
        from += s;
    }
    *pi = from;

    return from;
}

} // namespace util
} // namespace dend
