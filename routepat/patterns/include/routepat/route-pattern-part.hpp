#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

#include "routepat/route-pattern-parameter-policy-reference.hpp"
#include "routepat/route-value.hpp"
#include "routepat/vector.hpp"

namespace routepat {

enum class RoutePatternPartKind : std::uint8_t { Literal, Parameter, Separator };

enum class RoutePatternParameterKind : std::uint8_t {
  Standard,  // {id}
  Optional,  // {id?}
  CatchAll   // {*path} or {**path}
};

// Immutable piece of a path segment. Parts are shared between patterns through
// RoutePatternPartPtr, a pattern never modifies a part it did not create.
class RoutePatternPart {
 public:
  RoutePatternPart(const RoutePatternPart&) = delete;
  RoutePatternPart(RoutePatternPart&&) = delete;
  RoutePatternPart& operator=(const RoutePatternPart&) = delete;
  RoutePatternPart& operator=(RoutePatternPart&&) = delete;

  virtual ~RoutePatternPart() = default;

  [[nodiscard]] RoutePatternPartKind kind() const noexcept { return _kind; }

  [[nodiscard]] bool isLiteral() const noexcept { return _kind == RoutePatternPartKind::Literal; }
  [[nodiscard]] bool isParameter() const noexcept { return _kind == RoutePatternPartKind::Parameter; }
  [[nodiscard]] bool isSeparator() const noexcept { return _kind == RoutePatternPartKind::Separator; }

  // Template like rendering of this part, for diagnostics.
  [[nodiscard]] virtual std::string debugString() const = 0;

 protected:
  explicit RoutePatternPart(RoutePatternPartKind kind) noexcept : _kind(kind) {}

 private:
  RoutePatternPartKind _kind;
};

using RoutePatternPartPtr = std::shared_ptr<const RoutePatternPart>;

class RoutePatternLiteralPart : public RoutePatternPart {
 public:
  explicit RoutePatternLiteralPart(std::string content) noexcept
      : RoutePatternPart(RoutePatternPartKind::Literal), _content(std::move(content)) {}

  [[nodiscard]] std::string_view content() const noexcept { return _content; }

  [[nodiscard]] std::string debugString() const override { return _content; }

 private:
  std::string _content;
};

// Text between two parameters inside a segment, for instance the '.' in "{name}.{ext}".
class RoutePatternSeparatorPart : public RoutePatternPart {
 public:
  explicit RoutePatternSeparatorPart(std::string content) noexcept
      : RoutePatternPart(RoutePatternPartKind::Separator), _content(std::move(content)) {}

  [[nodiscard]] std::string_view content() const noexcept { return _content; }

  [[nodiscard]] std::string debugString() const override { return _content; }

 private:
  std::string _content;
};

using ParameterPolicyReferences = vector<RoutePatternParameterPolicyReference>;

class RoutePatternParameterPart : public RoutePatternPart {
 public:
  // No validation is made here, use the ParameterPart factory functions to build validated parameters.
  RoutePatternParameterPart(std::string name, RouteValue defaultValue, RoutePatternParameterKind parameterKind,
                            ParameterPolicyReferences parameterPolicies, bool encodeSlashes = true) noexcept
      : RoutePatternPart(RoutePatternPartKind::Parameter),
        _name(std::move(name)),
        _default(std::move(defaultValue)),
        _parameterPolicies(std::move(parameterPolicies)),
        _parameterKind(parameterKind),
        _encodeSlashes(encodeSlashes) {}

  [[nodiscard]] std::string_view name() const noexcept { return _name; }

  // The default value, std::monostate if none.
  [[nodiscard]] const RouteValue& defaultValue() const noexcept { return _default; }

  [[nodiscard]] RoutePatternParameterKind parameterKind() const noexcept { return _parameterKind; }

  [[nodiscard]] bool isOptional() const noexcept { return _parameterKind == RoutePatternParameterKind::Optional; }

  [[nodiscard]] bool isCatchAll() const noexcept { return _parameterKind == RoutePatternParameterKind::CatchAll; }

  [[nodiscard]] std::span<const RoutePatternParameterPolicyReference> parameterPolicies() const noexcept {
    return _parameterPolicies;
  }

  // Whether a '/' in a value bound to this parameter is percent-encoded when generating a path.
  // Only catch-all parameters written as {**path} keep their slashes.
  [[nodiscard]] bool encodeSlashes() const noexcept { return _encodeSlashes; }

  // Renders as {name:policy=default}, {name?}, {*name} or {**name}.
  [[nodiscard]] std::string debugString() const override;

 private:
  std::string _name;
  RouteValue _default;
  ParameterPolicyReferences _parameterPolicies;
  RoutePatternParameterKind _parameterKind;
  bool _encodeSlashes;
};

using RoutePatternParameterPartPtr = std::shared_ptr<const RoutePatternParameterPart>;

}  // namespace routepat
