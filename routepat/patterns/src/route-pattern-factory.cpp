#include "routepat/route-pattern-factory.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "routepat/flat-set.hpp"
#include "routepat/invalid-argument.hpp"
#include "routepat/invalid-operation.hpp"
#include "routepat/log.hpp"
#include "routepat/parameter-policy-value.hpp"
#include "routepat/route-pattern-exception.hpp"
#include "routepat/route-pattern-part.hpp"
#include "routepat/route-pattern-path-segment.hpp"
#include "routepat/route-pattern-tokenizer.hpp"
#include "routepat/route-pattern.hpp"
#include "routepat/route-value.hpp"
#include "routepat/string-equal-ignore-case.hpp"

namespace routepat {

namespace {

// Merges the 'out of line' defaults and parameter policies into the parameter parts of a pattern.
//
// Parameters having out of line data are rebuilt to carry it, and inline data of parameters is reported
// in the flat dictionaries (which may also hold entries not matching any parameter).
// Both views end up consistent: a value declared out of line behaves exactly like an inline one.
// Parts and segments that do not change are returned as is, so that a pattern built without out of line
// data shares all of its tree with the input.
class PatternMerger {
 public:
  PatternMerger(std::string_view rawText, const RouteValueDictionary* defaults,
                const ParameterPolicyValues* parameterPolicies)
      : _rawText(rawText) {
    if (defaults != nullptr) {
      _defaults = *defaults;
    }
    if (parameterPolicies != nullptr) {
      for (const auto& [name, policyValue] : *parameterPolicies) {
        _parameterPolicies.emplace(name, ToPolicyReferences(name, policyValue));
      }
    }
  }

  RoutePatternPathSegmentPtr visitSegment(const RoutePatternPathSegmentPtr& segment) {
    const auto parts = segment->parts();

    // stays empty as long as no part changes
    RoutePatternParts updatedParts;
    for (std::size_t partPos = 0; partPos < parts.size(); ++partPos) {
      RoutePatternPartPtr updatedPart = visitPart(parts[partPos]);
      if (updatedPart != parts[partPos]) {
        if (updatedParts.empty()) {
          updatedParts = RoutePatternParts(parts.begin(), parts.end());
        }
        updatedParts[partPos] = std::move(updatedPart);
      }
    }

    if (updatedParts.empty()) {
      return segment;
    }
    return std::make_shared<const RoutePatternPathSegment>(std::move(updatedParts));
  }

  RouteValueDictionary& defaults() noexcept { return _defaults; }

  ParameterPolicyDictionary& parameterPolicies() noexcept { return _parameterPolicies; }

 private:
  RoutePatternPartPtr visitPart(const RoutePatternPartPtr& part) {
    if (!part->isParameter()) {
      return part;
    }

    const auto& parameter = static_cast<const RoutePatternParameterPart&>(*part);
    const std::string name(parameter.name());
    const RouteValue& inlineDefault = parameter.defaultValue();

    RouteValue mergedDefault = inlineDefault;

    auto defaultIt = _defaults.find(name);
    if (defaultIt != _defaults.end()) {
      if (!IsNull(inlineDefault) && defaultIt->second != inlineDefault) {
        throw invalid_operation(
            "Route pattern '{}': parameter '{}' has both an inline default value '{}' and a different explicit "
            "default value '{}'",
            _rawText, name, RouteValueDebugString(inlineDefault), RouteValueDebugString(defaultIt->second));
      }
      if (parameter.isOptional()) {
        throw invalid_operation("Route pattern '{}': optional parameter '{}' cannot have a default value", _rawText,
                                name);
      }
      mergedDefault = defaultIt->second;
    } else if (!IsNull(inlineDefault)) {
      _defaults.emplace(name, inlineDefault);
    }

    const auto inlinePolicies = parameter.parameterPolicies();

    ParameterPolicyReferences* pMergedPolicies = nullptr;
    auto policiesIt = _parameterPolicies.find(name);
    if (policiesIt != _parameterPolicies.end()) {
      pMergedPolicies = &policiesIt->second;
    } else if (!inlinePolicies.empty()) {
      pMergedPolicies = &_parameterPolicies.emplace(name, ParameterPolicyReferences{}).first->second;
    }

    if (!inlinePolicies.empty()) {
      // Inline references come after the out of line ones. A reference already given out of line is not repeated.
      const auto outOfLineEnd = static_cast<std::ptrdiff_t>(pMergedPolicies->size());
      for (const RoutePatternParameterPolicyReference& policy : inlinePolicies) {
        const auto outOfLineFirst = pMergedPolicies->begin();
        if (std::find(outOfLineFirst, outOfLineFirst + outOfLineEnd, policy) == outOfLineFirst + outOfLineEnd) {
          pMergedPolicies->push_back(policy);
        }
      }
    }

    std::span<const RoutePatternParameterPolicyReference> mergedPolicies;
    if (pMergedPolicies != nullptr) {
      mergedPolicies = *pMergedPolicies;
    }

    if (mergedDefault == inlineDefault && std::ranges::equal(mergedPolicies, inlinePolicies)) {
      return part;
    }

    log::trace("Route pattern '{}': rebuilding parameter '{}' with out of line data", _rawText, name);

    return std::make_shared<const RoutePatternParameterPart>(
        name, std::move(mergedDefault), parameter.parameterKind(),
        ParameterPolicyReferences(mergedPolicies.begin(), mergedPolicies.end()), parameter.encodeSlashes());
  }

  ParameterPolicyReferences ToPolicyReferences(std::string_view name, const ParameterPolicyValue& policyValue) const {
    ParameterPolicyReferences policyReferences;
    try {
      if (policyValue.type() == ParameterPolicyValue::Type::List) {
        for (const ParameterPolicyValue& item : policyValue.items()) {
          // strings are converted into regex constraints
          policyReferences.push_back(ClassifyConstraint(item));
        }
      } else {
        policyReferences.push_back(ClassifyConstraint(policyValue));
      }
    } catch (const invalid_operation& ex) {
      throw invalid_operation("Route pattern '{}': invalid parameter policy for '{}': {}", _rawText, name, ex.what());
    }
    return policyReferences;
  }

  std::string_view _rawText;
  RouteValueDictionary _defaults;
  ParameterPolicyDictionary _parameterPolicies;
};

// Each required value either needs to:
//  1. be null-ish
//  2. have a corresponding parameter
//  3. have a corresponding default that matches both key and value
void CheckRequiredValues(std::string_view rawText, const RouteValueDictionary& requiredValues,
                         const FlatSet<std::string, CaseInsensitiveLessFunc>& parameterNames,
                         const RouteValueDictionary& defaults) {
  static const RouteValue kEmptyString{std::string()};

  for (const auto& [key, value] : requiredValues) {
    if (RouteValueEqual(kEmptyString, value)) {
      continue;
    }
    if (parameterNames.find(key) != parameterNames.end()) {
      continue;
    }
    const auto defaultIt = defaults.find(key);
    if (defaultIt != defaults.end() && RouteValueEqual(value, defaultIt->second)) {
      continue;
    }
    throw invalid_operation(
        "Route pattern '{}': no corresponding parameter or default value could be found for the required value "
        "'{}={}'",
        rawText, key, RouteValueDebugString(value));
  }
}

RoutePattern PatternCore(std::optional<std::string_view> rawText, const RouteValueDictionary* defaults,
                         const ParameterPolicyValues* parameterPolicies, const RouteValueDictionary* requiredValues,
                         std::span<const RoutePatternPathSegmentPtr> segments) {
  const std::string_view rawTextForErrors = rawText.value_or(std::string_view{});

  PatternMerger merger(rawTextForErrors, defaults, parameterPolicies);

  auto updatedSegments = std::make_shared<RoutePatternPathSegments>();
  updatedSegments->reserve(segments.size());

  auto parameters = std::make_shared<RoutePatternParameters>();
  FlatSet<std::string, CaseInsensitiveLessFunc> parameterNames;

  for (const RoutePatternPathSegmentPtr& segment : segments) {
    if (!segment) {
      throw invalid_argument("Route pattern '{}' cannot contain a null segment", rawTextForErrors);
    }
    updatedSegments->push_back(merger.visitSegment(segment));

    for (const RoutePatternPartPtr& part : updatedSegments->back()->parts()) {
      if (!part->isParameter()) {
        continue;
      }
      auto parameter = std::static_pointer_cast<const RoutePatternParameterPart>(part);
      if (!parameterNames.insert(std::string(parameter->name())).second) {
        throw route_pattern_exception(
            rawTextForErrors,
            fmt::format("The route parameter name '{}' appears more than one time in the route template",
                        parameter->name()));
      }
      parameters->push_back(std::move(parameter));
    }
  }

  if (requiredValues != nullptr) {
    CheckRequiredValues(rawTextForErrors, *requiredValues, parameterNames, merger.defaults());
  }

  log::debug("Built route pattern '{}' with {} segment(s) and {} parameter(s)", rawTextForErrors,
             updatedSegments->size(), parameters->size());

  RoutePattern::DefaultsPtr defaultsPtr = RoutePattern::EmptyValues();
  if (!merger.defaults().empty()) {
    defaultsPtr = std::make_shared<const RouteValueDictionary>(std::move(merger.defaults()));
  }
  RoutePattern::ParameterPoliciesPtr parameterPoliciesPtr = RoutePattern::EmptyPolicies();
  if (!merger.parameterPolicies().empty()) {
    parameterPoliciesPtr = std::make_shared<const ParameterPolicyDictionary>(std::move(merger.parameterPolicies()));
  }
  RoutePattern::DefaultsPtr requiredValuesPtr = RoutePattern::EmptyValues();
  if (requiredValues != nullptr && !requiredValues->empty()) {
    requiredValuesPtr = std::make_shared<const RouteValueDictionary>(*requiredValues);
  }
  RoutePattern::ParametersPtr parametersPtr = RoutePattern::EmptyParameters();
  if (!parameters->empty()) {
    parametersPtr = std::move(parameters);
  }
  RoutePattern::PathSegmentsPtr pathSegmentsPtr = RoutePattern::EmptyPathSegments();
  if (!updatedSegments->empty()) {
    pathSegmentsPtr = std::move(updatedSegments);
  }

  std::optional<std::string> ownedRawText;
  if (rawText) {
    ownedRawText.emplace(*rawText);
  }

  return {std::move(ownedRawText), std::move(defaultsPtr),    std::move(parameterPoliciesPtr),
          std::move(requiredValuesPtr), std::move(parametersPtr), std::move(pathSegmentsPtr)};
}

}  // namespace

RoutePattern Pattern(std::span<const RoutePatternPathSegmentPtr> segments) {
  return PatternCore(std::nullopt, nullptr, nullptr, nullptr, segments);
}

RoutePattern Pattern(std::initializer_list<RoutePatternPathSegmentPtr> segments) {
  return Pattern(std::span<const RoutePatternPathSegmentPtr>(segments.begin(), segments.size()));
}

RoutePattern Pattern(std::string_view rawText, std::span<const RoutePatternPathSegmentPtr> segments) {
  return PatternCore(rawText, nullptr, nullptr, nullptr, segments);
}

RoutePattern Pattern(std::string_view rawText, std::initializer_list<RoutePatternPathSegmentPtr> segments) {
  return Pattern(rawText, std::span<const RoutePatternPathSegmentPtr>(segments.begin(), segments.size()));
}

RoutePattern Pattern(std::optional<std::string_view> rawText, const RouteValueDictionary& defaults,
                     const ParameterPolicyValues& parameterPolicies,
                     std::span<const RoutePatternPathSegmentPtr> segments) {
  return PatternCore(rawText, &defaults, &parameterPolicies, nullptr, segments);
}

RoutePattern Pattern(std::optional<std::string_view> rawText, const RouteValueDictionary& defaults,
                     const ParameterPolicyValues& parameterPolicies,
                     std::initializer_list<RoutePatternPathSegmentPtr> segments) {
  return Pattern(rawText, defaults, parameterPolicies,
                 std::span<const RoutePatternPathSegmentPtr>(segments.begin(), segments.size()));
}

RoutePattern Pattern(std::optional<std::string_view> rawText, const RouteValueDictionary& defaults,
                     const ParameterPolicyValues& parameterPolicies, const RouteValueDictionary& requiredValues,
                     std::span<const RoutePatternPathSegmentPtr> segments) {
  return PatternCore(rawText, &defaults, &parameterPolicies, &requiredValues, segments);
}

RoutePattern Pattern(std::optional<std::string_view> rawText, const RouteValueDictionary& defaults,
                     const ParameterPolicyValues& parameterPolicies, const RouteValueDictionary& requiredValues,
                     std::initializer_list<RoutePatternPathSegmentPtr> segments) {
  return Pattern(rawText, defaults, parameterPolicies, requiredValues,
                 std::span<const RoutePatternPathSegmentPtr>(segments.begin(), segments.size()));
}

RoutePattern Parse(std::string_view pattern, const RoutePatternTokenizer& tokenizer) {
  const auto segments = tokenizer.tokenize(pattern);
  return PatternCore(pattern, nullptr, nullptr, nullptr, segments);
}

RoutePattern Parse(std::string_view pattern, const RoutePatternTokenizer& tokenizer,
                   const RouteValueDictionary& defaults, const ParameterPolicyValues& parameterPolicies) {
  const auto segments = tokenizer.tokenize(pattern);
  return PatternCore(pattern, &defaults, &parameterPolicies, nullptr, segments);
}

RoutePattern Parse(std::string_view pattern, const RoutePatternTokenizer& tokenizer,
                   const RouteValueDictionary& defaults, const ParameterPolicyValues& parameterPolicies,
                   const RouteValueDictionary& requiredValues) {
  const auto segments = tokenizer.tokenize(pattern);
  return PatternCore(pattern, &defaults, &parameterPolicies, &requiredValues, segments);
}

}  // namespace routepat
