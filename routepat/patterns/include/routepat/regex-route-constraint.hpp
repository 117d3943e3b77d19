#pragma once

#include <re2/re2.h>

#include <string>
#include <string_view>

#include "routepat/parameter-policy.hpp"
#include "routepat/regex-constraint-config.hpp"
#include "routepat/route-value.hpp"

namespace routepat {

// Constraint accepting values whose textual rendering matches a regular expression.
// The expression is used as given: anchoring is the responsibility of the caller
// (bare string constraints are anchored as ^(...)$ by the factory).
class RegexRouteConstraint : public RouteConstraint {
 public:
  // Throws invalid_argument if the expression is empty, does not compile or if config is invalid.
  explicit RegexRouteConstraint(std::string_view regex, const RegexConstraintConfig& config = {});

  [[nodiscard]] bool matches(const RouteValue& value) const override;

  [[nodiscard]] std::string describe() const override;

  [[nodiscard]] const std::string& pattern() const noexcept { return _regex.pattern(); }

 private:
  re2::RE2 _regex;
};

}  // namespace routepat
