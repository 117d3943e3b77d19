#pragma once

#include <string_view>

#include "routepat/route-pattern-path-segment.hpp"
#include "routepat/vector.hpp"

namespace routepat {

// Splits a route template into path segments.
// Implementations are expected to build their parts with the factory builders (LiteralPart, ParameterPart...)
// and to report template syntax errors with route_pattern_exception.
class RoutePatternTokenizer {
 public:
  RoutePatternTokenizer() noexcept = default;

  RoutePatternTokenizer(const RoutePatternTokenizer&) = delete;
  RoutePatternTokenizer(RoutePatternTokenizer&&) = delete;
  RoutePatternTokenizer& operator=(const RoutePatternTokenizer&) = delete;
  RoutePatternTokenizer& operator=(RoutePatternTokenizer&&) = delete;

  virtual ~RoutePatternTokenizer() = default;

  [[nodiscard]] virtual vector<RoutePatternPathSegmentPtr> tokenize(std::string_view pattern) const = 0;
};

}  // namespace routepat
