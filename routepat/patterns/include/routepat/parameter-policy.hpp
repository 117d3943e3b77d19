#pragma once

#include <string>

#include "routepat/route-value.hpp"

namespace routepat {

// A rule attached to a route parameter. Policies are only stored by route patterns,
// resolving and executing them belongs to the request matcher.
class ParameterPolicy {
 public:
  ParameterPolicy() noexcept = default;

  ParameterPolicy(const ParameterPolicy&) = delete;
  ParameterPolicy(ParameterPolicy&&) = delete;
  ParameterPolicy& operator=(const ParameterPolicy&) = delete;
  ParameterPolicy& operator=(ParameterPolicy&&) = delete;

  virtual ~ParameterPolicy() = default;

  // Short human readable description used in diagnostics.
  [[nodiscard]] virtual std::string describe() const = 0;
};

// A policy that validates the value bound to a parameter.
class RouteConstraint : public ParameterPolicy {
 public:
  // Returns true if the given parameter value is accepted by this constraint.
  [[nodiscard]] virtual bool matches(const RouteValue& value) const = 0;
};

}  // namespace routepat
