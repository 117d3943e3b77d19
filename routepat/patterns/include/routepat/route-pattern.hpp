#pragma once

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "routepat/flat-map.hpp"
#include "routepat/route-pattern-part.hpp"
#include "routepat/route-pattern-path-segment.hpp"
#include "routepat/route-value.hpp"
#include "routepat/string-equal-ignore-case.hpp"
#include "routepat/vector.hpp"

namespace routepat {

using ParameterPolicyDictionary = FlatMap<std::string, ParameterPolicyReferences, CaseInsensitiveLessFunc>;
using RoutePatternParameters = vector<RoutePatternParameterPartPtr>;
using RoutePatternPathSegments = vector<RoutePatternPathSegmentPtr>;

// Canonical, immutable representation of a route template.
//
// Inline parameter data (defaults and policies declared in parameter parts) and the flat dictionaries
// are always consistent: a parameter has exactly one logical default and one policy list, whatever the
// way it was declared. The dictionaries may also hold entries that do not correspond to any parameter.
//
// Instances are cheap to copy: collections are shared, immutable, and empty collections all point to
// the same process wide instances. A RoutePattern may be read concurrently from several threads.
// Build them with the factory functions of route-pattern-factory.hpp.
class RoutePattern {
 public:
  using DefaultsPtr = std::shared_ptr<const RouteValueDictionary>;
  using ParameterPoliciesPtr = std::shared_ptr<const ParameterPolicyDictionary>;
  using ParametersPtr = std::shared_ptr<const RoutePatternParameters>;
  using PathSegmentsPtr = std::shared_ptr<const RoutePatternPathSegments>;

  // Empty pattern (no segment, no parameters, no dictionary entries).
  RoutePattern();

  RoutePattern(std::optional<std::string> rawText, DefaultsPtr defaults, ParameterPoliciesPtr parameterPolicies,
               DefaultsPtr requiredValues, ParametersPtr parameters, PathSegmentsPtr pathSegments) noexcept;

  // The template text this pattern was built from, if any. Informational only.
  [[nodiscard]] const std::optional<std::string>& rawText() const noexcept { return _rawText; }

  [[nodiscard]] const RouteValueDictionary& defaults() const noexcept { return *_defaults; }

  [[nodiscard]] const ParameterPolicyDictionary& parameterPolicies() const noexcept { return *_parameterPolicies; }

  [[nodiscard]] const RouteValueDictionary& requiredValues() const noexcept { return *_requiredValues; }

  // All parameter parts, in segment then part order.
  [[nodiscard]] std::span<const RoutePatternParameterPartPtr> parameters() const noexcept { return *_parameters; }

  [[nodiscard]] std::span<const RoutePatternPathSegmentPtr> pathSegments() const noexcept { return *_pathSegments; }

  // Returns the parameter with the given name (case-insensitive), nullptr if not found.
  [[nodiscard]] const RoutePatternParameterPart* getParameter(std::string_view name) const noexcept;

  // Template like rendering of the segments ("users/{id}/{action=index}"), for diagnostics.
  [[nodiscard]] std::string debugString() const;

  // Shared handles on the collections. Used to share storage between patterns.
  [[nodiscard]] const DefaultsPtr& defaultsPtr() const noexcept { return _defaults; }
  [[nodiscard]] const ParameterPoliciesPtr& parameterPoliciesPtr() const noexcept { return _parameterPolicies; }
  [[nodiscard]] const DefaultsPtr& requiredValuesPtr() const noexcept { return _requiredValues; }
  [[nodiscard]] const ParametersPtr& parametersPtr() const noexcept { return _parameters; }
  [[nodiscard]] const PathSegmentsPtr& pathSegmentsPtr() const noexcept { return _pathSegments; }

  // Process wide empty instances.
  [[nodiscard]] static const DefaultsPtr& EmptyValues();
  [[nodiscard]] static const ParameterPoliciesPtr& EmptyPolicies();
  [[nodiscard]] static const ParametersPtr& EmptyParameters();
  [[nodiscard]] static const PathSegmentsPtr& EmptyPathSegments();

 private:
  std::optional<std::string> _rawText;
  DefaultsPtr _defaults;
  ParameterPoliciesPtr _parameterPolicies;
  DefaultsPtr _requiredValues;
  ParametersPtr _parameters;
  PathSegmentsPtr _pathSegments;
};

}  // namespace routepat
