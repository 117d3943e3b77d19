#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include "routepat/flat-map.hpp"
#include "routepat/string-equal-ignore-case.hpp"

namespace routepat {

// A default or required route value. std::monostate is the null value.
using RouteValue = std::variant<std::monostate, std::string, int64_t, double, bool>;

// Name -> value dictionary with case-insensitive unique keys.
using RouteValueDictionary = FlatMap<std::string, RouteValue, CaseInsensitiveLessFunc>;

[[nodiscard]] constexpr bool IsNull(const RouteValue& value) noexcept {
  return std::holds_alternative<std::monostate>(value);
}

// Invariant textual rendering of a value. Null renders as an empty string, booleans as "true" / "false".
[[nodiscard]] std::string RouteValueToString(const RouteValue& value);

// Rendering used in diagnostics: like RouteValueToString, but null renders as "null".
[[nodiscard]] std::string RouteValueDebugString(const RouteValue& value);

// Route value equality:
//  - two strings compare ordinal ignore-case
//  - two non null values compare their textual rendering ignore-case
//  - a null value equals any value rendering as an empty string (including another null)
[[nodiscard]] bool RouteValueEqual(const RouteValue& lhs, const RouteValue& rhs);

}  // namespace routepat
