#include "routepat/route-pattern.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "routepat/string-equal-ignore-case.hpp"

namespace routepat {

RoutePattern::RoutePattern()
    : _defaults(EmptyValues()),
      _parameterPolicies(EmptyPolicies()),
      _requiredValues(EmptyValues()),
      _parameters(EmptyParameters()),
      _pathSegments(EmptyPathSegments()) {}

RoutePattern::RoutePattern(std::optional<std::string> rawText, DefaultsPtr defaults,
                           ParameterPoliciesPtr parameterPolicies, DefaultsPtr requiredValues, ParametersPtr parameters,
                           PathSegmentsPtr pathSegments) noexcept
    : _rawText(std::move(rawText)),
      _defaults(std::move(defaults)),
      _parameterPolicies(std::move(parameterPolicies)),
      _requiredValues(std::move(requiredValues)),
      _parameters(std::move(parameters)),
      _pathSegments(std::move(pathSegments)) {}

const RoutePatternParameterPart* RoutePattern::getParameter(std::string_view name) const noexcept {
  for (const RoutePatternParameterPartPtr& parameter : *_parameters) {
    if (CaseInsensitiveEqual(parameter->name(), name)) {
      return parameter.get();
    }
  }
  return nullptr;
}

std::string RoutePattern::debugString() const {
  std::string ret;
  for (const RoutePatternPathSegmentPtr& segment : *_pathSegments) {
    if (!ret.empty()) {
      ret.push_back('/');
    }
    ret.append(segment->debugString());
  }
  return ret;
}

const RoutePattern::DefaultsPtr& RoutePattern::EmptyValues() {
  static const DefaultsPtr kEmpty = std::make_shared<const RouteValueDictionary>();
  return kEmpty;
}

const RoutePattern::ParameterPoliciesPtr& RoutePattern::EmptyPolicies() {
  static const ParameterPoliciesPtr kEmpty = std::make_shared<const ParameterPolicyDictionary>();
  return kEmpty;
}

const RoutePattern::ParametersPtr& RoutePattern::EmptyParameters() {
  static const ParametersPtr kEmpty = std::make_shared<const RoutePatternParameters>();
  return kEmpty;
}

const RoutePattern::PathSegmentsPtr& RoutePattern::EmptyPathSegments() {
  static const PathSegmentsPtr kEmpty = std::make_shared<const RoutePatternPathSegments>();
  return kEmpty;
}

}  // namespace routepat
