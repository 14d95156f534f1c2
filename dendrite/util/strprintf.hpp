#pragma once

// printf-like routines that return std::string.

#include <string>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace dend {
namespace util {

// Substitute instances of '{}' in the format string with the following parameters,
// using fmt formatting.

template <typename... Args>
std::string pprintf(const char* s, Args&&... args) {
    return fmt::format(fmt::runtime(s), std::forward<Args>(args)...);
}

} // namespace util
} // namespace dend
