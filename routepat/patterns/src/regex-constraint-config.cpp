#include "routepat/regex-constraint-config.hpp"

#include <cstdint>

#include "routepat/invalid-argument.hpp"

namespace routepat {

void RegexConstraintConfig::validate() const {
  if (maxProgramMemory < kMinProgramMemory) {
    throw invalid_argument("maxProgramMemory should be at least {} bytes", kMinProgramMemory);
  }
}

RegexConstraintConfig& RegexConstraintConfig::withCaseInsensitive(bool enable) {
  caseInsensitive = enable;
  return *this;
}

RegexConstraintConfig& RegexConstraintConfig::withMaxProgramMemory(int64_t maxMem) {
  maxProgramMemory = maxMem;
  return *this;
}

}  // namespace routepat
