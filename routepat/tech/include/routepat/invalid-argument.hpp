#pragma once

#include <fmt/format.h>

#include <utility>

#include "routepat/exception.hpp"

namespace routepat {

// Null, empty or syntactically invalid input given to a builder.
class invalid_argument : public exception {
 public:
  template <unsigned N>
  explicit invalid_argument(const char (&str)[N]) noexcept
    requires(N <= kMsgMaxLen + 1)
      : exception(str) {}

  template <typename... Args>
  explicit invalid_argument(fmt::format_string<Args...> fmt, Args&&... args)
      : exception(fmt, std::forward<Args>(args)...) {}
};

}  // namespace routepat
