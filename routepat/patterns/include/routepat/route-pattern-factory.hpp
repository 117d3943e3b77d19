#pragma once

#include <initializer_list>
#include <memory>
#include <optional>
#include <span>
#include <string_view>

#include "routepat/parameter-policy-value.hpp"
#include "routepat/parameter-policy.hpp"
#include "routepat/regex-constraint-config.hpp"
#include "routepat/route-pattern-parameter-policy-reference.hpp"
#include "routepat/route-pattern-part.hpp"
#include "routepat/route-pattern-path-segment.hpp"
#include "routepat/route-pattern-tokenizer.hpp"
#include "routepat/route-pattern.hpp"
#include "routepat/route-value.hpp"

namespace routepat {

// Factory functions building route pattern objects.
//
// Builders validate their own input only and throw invalid_argument on null / empty / malformed data.
// Pattern() reconciles the segments with out-of-line data and throws invalid_operation when they conflict.
// Every function either returns a fully consistent object or throws, inputs are never modified.

// Parts & segments

// Throws invalid_argument if content is empty or contains '?'.
[[nodiscard]] std::shared_ptr<const RoutePatternLiteralPart> LiteralPart(std::string_view content);

// Throws invalid_argument if content is empty.
[[nodiscard]] std::shared_ptr<const RoutePatternSeparatorPart> SeparatorPart(std::string_view content);

// Parameter builders throw invalid_argument if the name is empty or contains one of the reserved
// template characters '{', '}', '/', '?', '*', or if an Optional parameter is given a non null default.
[[nodiscard]] RoutePatternParameterPartPtr ParameterPart(std::string_view parameterName);

[[nodiscard]] RoutePatternParameterPartPtr ParameterPart(std::string_view parameterName, RouteValue defaultValue);

[[nodiscard]] RoutePatternParameterPartPtr ParameterPart(std::string_view parameterName, RouteValue defaultValue,
                                                         RoutePatternParameterKind parameterKind);

[[nodiscard]] RoutePatternParameterPartPtr ParameterPart(
    std::string_view parameterName, RouteValue defaultValue, RoutePatternParameterKind parameterKind,
    std::span<const RoutePatternParameterPolicyReference> parameterPolicies, bool encodeSlashes = true);

[[nodiscard]] RoutePatternParameterPartPtr ParameterPart(
    std::string_view parameterName, RouteValue defaultValue, RoutePatternParameterKind parameterKind,
    std::initializer_list<RoutePatternParameterPolicyReference> parameterPolicies);

// Groups parts into a segment. No cross-part validation is performed.
[[nodiscard]] RoutePatternPathSegmentPtr Segment(std::span<const RoutePatternPartPtr> parts);

[[nodiscard]] RoutePatternPathSegmentPtr Segment(std::initializer_list<RoutePatternPartPtr> parts);

// Policy references

// Reference to a resolved constraint. Throws invalid_argument if constraint is null.
[[nodiscard]] RoutePatternParameterPolicyReference Constraint(std::shared_ptr<const RouteConstraint> constraint);

// A bare string constraint is a regular expression, matched against the whole value: it is wrapped into a
// RegexRouteConstraint over "^(regex)$". Throws invalid_argument if regex is empty or invalid.
[[nodiscard]] RoutePatternParameterPolicyReference Constraint(std::string_view regex,
                                                              const RegexConstraintConfig& config = {});

// Classifies a caller supplied constraint: a parameter policy object (route constraint or not) is referenced
// as is, a string becomes a regex constraint. Anything else (null policy, list, other value) throws
// invalid_operation.
[[nodiscard]] RoutePatternParameterPolicyReference ClassifyConstraint(const ParameterPolicyValue& constraint);

// Reference to a resolved policy. Throws invalid_argument if parameterPolicy is null.
[[nodiscard]] RoutePatternParameterPolicyReference PolicyReference(
    std::shared_ptr<const ParameterPolicy> parameterPolicy);

// Deferred reference to a named policy, resolved later by a policy factory.
// Throws invalid_argument if parameterPolicy is empty.
[[nodiscard]] RoutePatternParameterPolicyReference PolicyReference(std::string_view parameterPolicy);

// Patterns

[[nodiscard]] RoutePattern Pattern(std::span<const RoutePatternPathSegmentPtr> segments);

[[nodiscard]] RoutePattern Pattern(std::initializer_list<RoutePatternPathSegmentPtr> segments);

[[nodiscard]] RoutePattern Pattern(std::string_view rawText, std::span<const RoutePatternPathSegmentPtr> segments);

[[nodiscard]] RoutePattern Pattern(std::string_view rawText, std::initializer_list<RoutePatternPathSegmentPtr> segments);

// Builds a pattern merging the out-of-line defaults and parameter policies into the segments.
//  - an out-of-line default for a parameter must match its inline default if it has one, and is forbidden
//    for optional parameters
//  - inline defaults and policies are reported in the flat dictionaries
//  - out-of-line policy values may be policy objects, strings (regex constraints) or lists of those
// Throws invalid_operation on conflict, route_pattern_exception if two parameters share the same name.
[[nodiscard]] RoutePattern Pattern(std::optional<std::string_view> rawText, const RouteValueDictionary& defaults,
                                   const ParameterPolicyValues& parameterPolicies,
                                   std::span<const RoutePatternPathSegmentPtr> segments);

[[nodiscard]] RoutePattern Pattern(std::optional<std::string_view> rawText, const RouteValueDictionary& defaults,
                                   const ParameterPolicyValues& parameterPolicies,
                                   std::initializer_list<RoutePatternPathSegmentPtr> segments);

// Same as above, and additionally checks the required values: each of them must be null-ish (equal to the empty
// string), or correspond to a parameter, or to a default with an equal value.
[[nodiscard]] RoutePattern Pattern(std::optional<std::string_view> rawText, const RouteValueDictionary& defaults,
                                   const ParameterPolicyValues& parameterPolicies,
                                   const RouteValueDictionary& requiredValues,
                                   std::span<const RoutePatternPathSegmentPtr> segments);

[[nodiscard]] RoutePattern Pattern(std::optional<std::string_view> rawText, const RouteValueDictionary& defaults,
                                   const ParameterPolicyValues& parameterPolicies,
                                   const RouteValueDictionary& requiredValues,
                                   std::initializer_list<RoutePatternPathSegmentPtr> segments);

// Tokenizes pattern with the given tokenizer, then builds the pattern as Pattern() does.
[[nodiscard]] RoutePattern Parse(std::string_view pattern, const RoutePatternTokenizer& tokenizer);

[[nodiscard]] RoutePattern Parse(std::string_view pattern, const RoutePatternTokenizer& tokenizer,
                                 const RouteValueDictionary& defaults, const ParameterPolicyValues& parameterPolicies);

[[nodiscard]] RoutePattern Parse(std::string_view pattern, const RoutePatternTokenizer& tokenizer,
                                 const RouteValueDictionary& defaults, const ParameterPolicyValues& parameterPolicies,
                                 const RouteValueDictionary& requiredValues);

// Concatenates two canonical patterns (a group prefix and a nested route for instance).
// Raw texts are joined with a single '/', segments and parameters are concatenated, dictionaries are unioned.
// Throws route_pattern_exception if a parameter name appears on both sides, invalid_operation if a dictionary
// key is present on both sides with different values.
[[nodiscard]] RoutePattern Combine(const RoutePattern& left, const RoutePattern& right);

}  // namespace routepat
