#pragma once

#include <cstdint>

namespace routepat {

// Options applied when a bare string constraint is compiled into a RegexRouteConstraint.
struct RegexConstraintConfig {
  static constexpr int64_t kMinProgramMemory = 64L * 1024L;

  void validate() const;

  // Route values are matched ignoring case by default, consistent with the case-insensitive
  // handling of parameter names.
  RegexConstraintConfig& withCaseInsensitive(bool enable = true);

  // Upper bound of the memory the regex engine may use for one compiled constraint.
  RegexConstraintConfig& withMaxProgramMemory(int64_t maxMem);

  bool caseInsensitive{true};

  // Default: 8 MiB (RE2 default). Must be >= kMinProgramMemory.
  int64_t maxProgramMemory{8L * 1024L * 1024L};
};

}  // namespace routepat
