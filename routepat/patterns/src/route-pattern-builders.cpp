#include <fmt/format.h>

#include <initializer_list>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "routepat/invalid-argument.hpp"
#include "routepat/invalid-operation.hpp"
#include "routepat/parameter-policy-value.hpp"
#include "routepat/parameter-policy.hpp"
#include "routepat/regex-constraint-config.hpp"
#include "routepat/regex-route-constraint.hpp"
#include "routepat/route-pattern-factory.hpp"
#include "routepat/route-pattern-parameter-policy-reference.hpp"
#include "routepat/route-pattern-part.hpp"
#include "routepat/route-pattern-path-segment.hpp"
#include "routepat/route-value.hpp"

namespace routepat {

namespace {

// Characters with a meaning in route templates, forbidden in parameter names.
constexpr std::string_view kInvalidParameterNameChars = "{}/?*";

void CheckParameter(std::string_view parameterName, const RouteValue& defaultValue,
                    RoutePatternParameterKind parameterKind) {
  if (parameterName.empty()) {
    throw invalid_argument("Route parameter name cannot be empty");
  }
  if (parameterName.find_first_of(kInvalidParameterNameChars) != std::string_view::npos) {
    throw invalid_argument(
        "The route parameter name '{}' is invalid. Route parameter names cannot contain these characters: "
        "'{{', '}}', '/', '?', '*'",
        parameterName);
  }
  if (parameterKind == RoutePatternParameterKind::Optional && !IsNull(defaultValue)) {
    throw invalid_argument("Optional route parameter '{}' cannot have a default value", parameterName);
  }
}

RoutePatternParameterPartPtr ParameterPartCore(std::string_view parameterName, RouteValue defaultValue,
                                               RoutePatternParameterKind parameterKind,
                                               ParameterPolicyReferences parameterPolicies, bool encodeSlashes = true) {
  return std::make_shared<const RoutePatternParameterPart>(std::string(parameterName), std::move(defaultValue),
                                                           parameterKind, std::move(parameterPolicies), encodeSlashes);
}

RoutePatternParameterPolicyReference RegexConstraintCore(std::string_view regex, const RegexConstraintConfig& config) {
  return RoutePatternParameterPolicyReference(
      std::make_shared<const RegexRouteConstraint>(fmt::format("^({})$", regex), config));
}

}  // namespace

std::shared_ptr<const RoutePatternLiteralPart> LiteralPart(std::string_view content) {
  if (content.empty()) {
    throw invalid_argument("Literal part content cannot be empty");
  }
  if (content.find('?') != std::string_view::npos) {
    throw invalid_argument("The literal section '{}' is invalid. Literal sections cannot contain the '?' character",
                           content);
  }
  return std::make_shared<const RoutePatternLiteralPart>(std::string(content));
}

std::shared_ptr<const RoutePatternSeparatorPart> SeparatorPart(std::string_view content) {
  if (content.empty()) {
    throw invalid_argument("Separator part content cannot be empty");
  }
  return std::make_shared<const RoutePatternSeparatorPart>(std::string(content));
}

RoutePatternParameterPartPtr ParameterPart(std::string_view parameterName) {
  return ParameterPart(parameterName, RouteValue{}, RoutePatternParameterKind::Standard);
}

RoutePatternParameterPartPtr ParameterPart(std::string_view parameterName, RouteValue defaultValue) {
  return ParameterPart(parameterName, std::move(defaultValue), RoutePatternParameterKind::Standard);
}

RoutePatternParameterPartPtr ParameterPart(std::string_view parameterName, RouteValue defaultValue,
                                           RoutePatternParameterKind parameterKind) {
  CheckParameter(parameterName, defaultValue, parameterKind);
  return ParameterPartCore(parameterName, std::move(defaultValue), parameterKind, ParameterPolicyReferences{});
}

RoutePatternParameterPartPtr ParameterPart(std::string_view parameterName, RouteValue defaultValue,
                                           RoutePatternParameterKind parameterKind,
                                           std::span<const RoutePatternParameterPolicyReference> parameterPolicies,
                                           bool encodeSlashes) {
  CheckParameter(parameterName, defaultValue, parameterKind);
  if (!encodeSlashes && parameterKind != RoutePatternParameterKind::CatchAll) {
    throw invalid_argument("Route parameter '{}' cannot keep slashes unencoded, only catch-all parameters can",
                           parameterName);
  }
  return ParameterPartCore(parameterName, std::move(defaultValue), parameterKind,
                           ParameterPolicyReferences(parameterPolicies.begin(), parameterPolicies.end()),
                           encodeSlashes);
}

RoutePatternParameterPartPtr ParameterPart(std::string_view parameterName, RouteValue defaultValue,
                                           RoutePatternParameterKind parameterKind,
                                           std::initializer_list<RoutePatternParameterPolicyReference> parameterPolicies) {
  return ParameterPart(parameterName, std::move(defaultValue), parameterKind,
                       std::span<const RoutePatternParameterPolicyReference>(parameterPolicies.begin(),
                                                                            parameterPolicies.size()));
}

RoutePatternPathSegmentPtr Segment(std::span<const RoutePatternPartPtr> parts) {
  for (const RoutePatternPartPtr& part : parts) {
    if (!part) {
      throw invalid_argument("Route pattern segment cannot contain a null part");
    }
  }
  return std::make_shared<const RoutePatternPathSegment>(RoutePatternParts(parts.begin(), parts.end()));
}

RoutePatternPathSegmentPtr Segment(std::initializer_list<RoutePatternPartPtr> parts) {
  return Segment(std::span<const RoutePatternPartPtr>(parts.begin(), parts.size()));
}

RoutePatternParameterPolicyReference Constraint(std::shared_ptr<const RouteConstraint> constraint) {
  if (!constraint) {
    throw invalid_argument("Route constraint cannot be null");
  }
  return RoutePatternParameterPolicyReference(std::shared_ptr<const ParameterPolicy>(std::move(constraint)));
}

RoutePatternParameterPolicyReference Constraint(std::string_view regex, const RegexConstraintConfig& config) {
  if (regex.empty()) {
    throw invalid_argument("Regex constraint cannot be empty");
  }
  return RegexConstraintCore(regex, config);
}

RoutePatternParameterPolicyReference ClassifyConstraint(const ParameterPolicyValue& constraint) {
  switch (constraint.type()) {
    case ParameterPolicyValue::Type::Policy:
      if (constraint.policy()) {
        return RoutePatternParameterPolicyReference(constraint.policy());
      }
      break;
    case ParameterPolicyValue::Type::Text:
      return RegexConstraintCore(constraint.text(), RegexConstraintConfig{});
    default:
      break;
  }
  throw invalid_operation("Invalid constraint '{}'. A constraint must be a string or a parameter policy object",
                          constraint.debugString());
}

RoutePatternParameterPolicyReference PolicyReference(std::shared_ptr<const ParameterPolicy> parameterPolicy) {
  if (!parameterPolicy) {
    throw invalid_argument("Parameter policy cannot be null");
  }
  return RoutePatternParameterPolicyReference(std::move(parameterPolicy));
}

RoutePatternParameterPolicyReference PolicyReference(std::string_view parameterPolicy) {
  if (parameterPolicy.empty()) {
    throw invalid_argument("Parameter policy name cannot be empty");
  }
  return RoutePatternParameterPolicyReference(std::string(parameterPolicy));
}

}  // namespace routepat
