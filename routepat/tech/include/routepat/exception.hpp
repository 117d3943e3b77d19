#pragma once

#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <exception>
#include <iterator>
#include <string_view>
#include <utility>

namespace routepat {

// Base exception of the library. The message is stored inline (no allocation after formatting)
// and truncated with "..." when it does not fit.
class exception : public std::exception {
 public:
  static constexpr std::size_t kMsgMaxLen = 255;

  template <unsigned N>
  explicit exception(const char (&str)[N]) noexcept
    requires(N <= kMsgMaxLen + 1)
  {
    std::memcpy(_data, str, N);
  }

  template <typename... Args>
  explicit exception(fmt::format_string<Args...> fmt, Args&&... args) {
    const auto out = fmt::format_to_n(_data, kMsgMaxLen, fmt, std::forward<Args>(args)...);
    if (out.size > kMsgMaxLen) {
      static constexpr std::string_view kEllipsis = "...";
      std::ranges::copy(kEllipsis, _data + kMsgMaxLen - kEllipsis.size());
      _data[kMsgMaxLen] = '\0';
    } else {
      *out.out = '\0';
    }
  }

  [[nodiscard]] const char* what() const noexcept override { return _data; }

 private:
  char _data[kMsgMaxLen + 1];
};

}  // namespace routepat
