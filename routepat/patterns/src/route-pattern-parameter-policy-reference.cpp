#include "routepat/route-pattern-parameter-policy-reference.hpp"

#include <string>
#include <utility>

#include "routepat/parameter-policy-value.hpp"

namespace routepat {

std::string RoutePatternParameterPolicyReference::debugString() const {
  if (_parameterPolicy) {
    return _parameterPolicy->describe();
  }
  return _content;
}

std::string ParameterPolicyValue::debugString() const {
  switch (_type) {
    case Type::Policy:
      return _policy ? _policy->describe() : "null";
    case Type::Text:
      return _text;
    case Type::List: {
      std::string ret(1, '[');
      for (const ParameterPolicyValue& item : _items) {
        if (ret.size() > 1U) {
          ret.append(", ");
        }
        ret.append(item.debugString());
      }
      ret.push_back(']');
      return ret;
    }
    case Type::Value:
      return RouteValueDebugString(_value);
  }
  std::unreachable();
}

}  // namespace routepat
