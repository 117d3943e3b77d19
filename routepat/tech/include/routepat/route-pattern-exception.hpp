#pragma once

#include <algorithm>
#include <cstddef>
#include <string_view>

#include "routepat/exception.hpp"

namespace routepat {

// Structural error in a route template. Keeps the offending template text for diagnostics,
// the message itself describes the problem.
// Both are stored inline, a too long pattern is truncated with "..." like the message.
class route_pattern_exception : public exception {
 public:
  static constexpr std::size_t kPatternMaxLen = 127;

  route_pattern_exception(std::string_view pattern, std::string_view message) : exception("{}", message) {
    if (pattern.size() > kPatternMaxLen) {
      static constexpr std::string_view kEllipsis = "...";
      std::ranges::copy(kEllipsis,
                        std::ranges::copy(pattern.substr(0, kPatternMaxLen - kEllipsis.size()), _pattern).out);
      _patternLen = kPatternMaxLen;
    } else {
      std::ranges::copy(pattern, _pattern);
      _patternLen = pattern.size();
    }
  }

  [[nodiscard]] std::string_view pattern() const noexcept { return {_pattern, _patternLen}; }

 private:
  char _pattern[kPatternMaxLen];
  std::size_t _patternLen;
};

}  // namespace routepat
