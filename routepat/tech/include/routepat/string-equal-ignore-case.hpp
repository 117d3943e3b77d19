#pragma once

#include <algorithm>
#include <string_view>

#include "routepat/toupperlower.hpp"

namespace routepat {

// Ordinal ignore-case comparisons of route names and dictionary keys.

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) noexcept {
  return std::ranges::equal(lhs, rhs, {}, tolower, tolower);
}

constexpr bool CaseInsensitiveLess(std::string_view lhs, std::string_view rhs) noexcept {
  return std::ranges::lexicographical_compare(lhs, rhs, {}, tolower, tolower);
}

// Transparent comparator for sorted containers keyed by route names.
struct CaseInsensitiveLessFunc {
  using is_transparent = void;

  constexpr bool operator()(std::string_view lhs, std::string_view rhs) const noexcept {
    return CaseInsensitiveLess(lhs, rhs);
  }
};

}  // namespace routepat
