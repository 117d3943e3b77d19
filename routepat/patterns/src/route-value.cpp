#include "routepat/route-value.hpp"

#include <fmt/format.h>

#include <cstdint>
#include <string>
#include <type_traits>
#include <variant>

#include "routepat/string-equal-ignore-case.hpp"

namespace routepat {

std::string RouteValueToString(const RouteValue& value) {
  return std::visit(
      [](const auto& val) -> std::string {
        using T = std::decay_t<decltype(val)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return {};
        } else if constexpr (std::is_same_v<T, std::string>) {
          return val;
        } else if constexpr (std::is_same_v<T, bool>) {
          return val ? "true" : "false";
        } else {
          return fmt::format("{}", val);
        }
      },
      value);
}

std::string RouteValueDebugString(const RouteValue& value) {
  if (IsNull(value)) {
    return "null";
  }
  return RouteValueToString(value);
}

bool RouteValueEqual(const RouteValue& lhs, const RouteValue& rhs) {
  const auto* pLhsStr = std::get_if<std::string>(&lhs);
  const auto* pRhsStr = std::get_if<std::string>(&rhs);
  if (pLhsStr != nullptr && pRhsStr != nullptr) {
    return CaseInsensitiveEqual(*pLhsStr, *pRhsStr);
  }
  if (!IsNull(lhs) && !IsNull(rhs)) {
    return CaseInsensitiveEqual(RouteValueToString(lhs), RouteValueToString(rhs));
  }
  // at least one of them is null
  return RouteValueToString(lhs).empty() && RouteValueToString(rhs).empty();
}

}  // namespace routepat
