#pragma once

#include <concepts>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "routepat/flat-map.hpp"
#include "routepat/parameter-policy.hpp"
#include "routepat/route-value.hpp"
#include "routepat/string-equal-ignore-case.hpp"

namespace routepat {

// Out-of-line policy of one parameter, as supplied by the caller:
//  - a policy object
//  - a string (a regular expression when used as a constraint)
//  - a list of the above
//  - any other value, which is not a valid policy and is rejected when classified
class ParameterPolicyValue {
 public:
  enum class Type : std::uint8_t { Policy, Text, List, Value };

  template <class Policy>
    requires std::derived_from<Policy, ParameterPolicy>
  ParameterPolicyValue(std::shared_ptr<Policy> policy) noexcept  // NOLINT(google-explicit-constructor)
      : _policy(std::move(policy)), _type(Type::Policy) {}

  ParameterPolicyValue(std::string text) noexcept  // NOLINT(google-explicit-constructor)
      : _text(std::move(text)), _type(Type::Text) {}

  ParameterPolicyValue(const char* text)  // NOLINT(google-explicit-constructor)
      : _text(text), _type(Type::Text) {}

  ParameterPolicyValue(std::initializer_list<ParameterPolicyValue> items)
      : _items(items), _type(Type::List) {}

  explicit ParameterPolicyValue(std::vector<ParameterPolicyValue> items) noexcept
      : _items(std::move(items)), _type(Type::List) {}

  // A value that is neither a policy nor a string.
  [[nodiscard]] static ParameterPolicyValue OfValue(RouteValue value) {
    ParameterPolicyValue ret(std::vector<ParameterPolicyValue>{});
    ret._value = std::move(value);
    ret._type = Type::Value;
    return ret;
  }

  [[nodiscard]] Type type() const noexcept { return _type; }

  // Valid when type() == Type::Policy (may still be nullptr).
  [[nodiscard]] const std::shared_ptr<const ParameterPolicy>& policy() const noexcept { return _policy; }

  // Valid when type() == Type::Text.
  [[nodiscard]] std::string_view text() const noexcept { return _text; }

  // Valid when type() == Type::List.
  [[nodiscard]] std::span<const ParameterPolicyValue> items() const noexcept { return _items; }

  // Valid when type() == Type::Value.
  [[nodiscard]] const RouteValue& value() const noexcept { return _value; }

  [[nodiscard]] std::string debugString() const;

 private:
  std::shared_ptr<const ParameterPolicy> _policy;
  std::string _text;
  // std::vector, as it supports an incomplete element type
  std::vector<ParameterPolicyValue> _items;
  RouteValue _value;
  Type _type;
};

// Caller supplied out-of-line policies, keyed by parameter name (case-insensitive).
using ParameterPolicyValues = FlatMap<std::string, ParameterPolicyValue, CaseInsensitiveLessFunc>;

}  // namespace routepat
