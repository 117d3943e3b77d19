#pragma once

#include <string_view>

namespace routepat {

// Removes all leading occurrences of ch.
constexpr std::string_view TrimLeading(std::string_view sv, char ch) noexcept {
  while (!sv.empty() && sv.front() == ch) {
    sv.remove_prefix(1U);
  }
  return sv;
}

// Removes all trailing occurrences of ch.
constexpr std::string_view TrimTrailing(std::string_view sv, char ch) noexcept {
  while (!sv.empty() && sv.back() == ch) {
    sv.remove_suffix(1U);
  }
  return sv;
}

}  // namespace routepat
