#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "routepat/parameter-policy.hpp"

namespace routepat {

// Reference to a parameter policy: either an already resolved policy object,
// or a textual reference (for instance "int" or "range(1,10)") that a policy factory resolves later.
class RoutePatternParameterPolicyReference {
 public:
  explicit RoutePatternParameterPolicyReference(std::shared_ptr<const ParameterPolicy> parameterPolicy) noexcept
      : _parameterPolicy(std::move(parameterPolicy)) {}

  explicit RoutePatternParameterPolicyReference(std::string content) noexcept : _content(std::move(content)) {}

  [[nodiscard]] bool isResolved() const noexcept { return _parameterPolicy != nullptr; }

  // The textual reference. Empty for resolved references.
  [[nodiscard]] std::string_view content() const noexcept { return _content; }

  // The resolved policy, nullptr for textual references.
  [[nodiscard]] const std::shared_ptr<const ParameterPolicy>& parameterPolicy() const noexcept {
    return _parameterPolicy;
  }

  [[nodiscard]] std::string debugString() const;

  // Resolved references are equal when they share the same policy instance,
  // textual ones when their content is identical.
  bool operator==(const RoutePatternParameterPolicyReference&) const noexcept = default;

 private:
  std::shared_ptr<const ParameterPolicy> _parameterPolicy;
  std::string _content;
};

}  // namespace routepat
