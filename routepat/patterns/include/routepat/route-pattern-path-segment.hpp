#pragma once

#include <memory>
#include <span>
#include <string>

#include "routepat/route-pattern-part.hpp"
#include "routepat/vector.hpp"

namespace routepat {

using RoutePatternParts = vector<RoutePatternPartPtr>;

// One '/' delimited section of a route pattern: an ordered list of parts.
// No cross-part validation is made, adjacency rules belong to the tokenizer.
class RoutePatternPathSegment {
 public:
  explicit RoutePatternPathSegment(RoutePatternParts parts) noexcept : _parts(std::move(parts)) {}

  [[nodiscard]] std::span<const RoutePatternPartPtr> parts() const noexcept { return _parts; }

  // A simple segment is made of a single part.
  [[nodiscard]] bool isSimple() const noexcept { return _parts.size() == 1U; }

  [[nodiscard]] std::string debugString() const;

 private:
  RoutePatternParts _parts;
};

using RoutePatternPathSegmentPtr = std::shared_ptr<const RoutePatternPathSegment>;

}  // namespace routepat
