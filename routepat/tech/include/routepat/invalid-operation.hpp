#pragma once

#include <fmt/format.h>

#include <utility>

#include "routepat/exception.hpp"

namespace routepat {

// Inputs that are individually valid but cannot be reconciled together
// (conflicting values, unsatisfied requirements, unsupported policy shapes).
class invalid_operation : public exception {
 public:
  template <unsigned N>
  explicit invalid_operation(const char (&str)[N]) noexcept
    requires(N <= kMsgMaxLen + 1)
      : exception(str) {}

  template <typename... Args>
  explicit invalid_operation(fmt::format_string<Args...> fmt, Args&&... args)
      : exception(fmt, std::forward<Args>(args)...) {}
};

}  // namespace routepat
