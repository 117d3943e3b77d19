#include "routepat/regex-route-constraint.hpp"

#include <re2/re2.h>

#include <string>
#include <string_view>

#include "routepat/invalid-argument.hpp"
#include "routepat/regex-constraint-config.hpp"
#include "routepat/route-value.hpp"

namespace routepat {

namespace {

std::string CheckedRegex(std::string_view regex) {
  if (regex.empty()) {
    throw invalid_argument("Regex constraint expression cannot be empty");
  }
  return std::string(regex);
}

RE2::Options CheckedOptions(const RegexConstraintConfig& config) {
  config.validate();

  RE2::Options options;
  options.set_case_sensitive(!config.caseInsensitive);
  options.set_max_mem(config.maxProgramMemory);
  options.set_log_errors(false);
  return options;
}

}  // namespace

RegexRouteConstraint::RegexRouteConstraint(std::string_view regex, const RegexConstraintConfig& config)
    : _regex(CheckedRegex(regex), CheckedOptions(config)) {
  if (!_regex.ok()) {
    throw invalid_argument("Invalid regex constraint '{}': {}", _regex.pattern(), _regex.error());
  }
}

bool RegexRouteConstraint::matches(const RouteValue& value) const {
  if (IsNull(value)) {
    return false;
  }
  return RE2::PartialMatch(RouteValueToString(value), _regex);
}

std::string RegexRouteConstraint::describe() const { return "regex(" + _regex.pattern() + ")"; }

}  // namespace routepat
