#include "routepat/route-pattern-part.hpp"

#include <string>

#include "routepat/route-value.hpp"

namespace routepat {

std::string RoutePatternParameterPart::debugString() const {
  std::string ret(1, '{');
  if (isCatchAll()) {
    ret.append(_encodeSlashes ? "*" : "**");
  }
  ret.append(_name);
  for (const auto& policy : _parameterPolicies) {
    ret.push_back(':');
    ret.append(policy.debugString());
  }
  if (!IsNull(_default)) {
    ret.push_back('=');
    ret.append(RouteValueToString(_default));
  }
  if (isOptional()) {
    ret.push_back('?');
  }
  ret.push_back('}');
  return ret;
}

}  // namespace routepat
