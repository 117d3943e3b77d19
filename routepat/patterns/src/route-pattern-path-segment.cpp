#include "routepat/route-pattern-path-segment.hpp"

#include <string>

#include "routepat/route-pattern-part.hpp"

namespace routepat {

std::string RoutePatternPathSegment::debugString() const {
  std::string ret;
  for (const RoutePatternPartPtr& part : _parts) {
    ret.append(part->debugString());
  }
  return ret;
}

}  // namespace routepat
