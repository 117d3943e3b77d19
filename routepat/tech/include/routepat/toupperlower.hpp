#pragma once

namespace routepat {

// ASCII only lower casing, route names are never locale dependent.
constexpr char tolower(char ch) noexcept { return ch >= 'A' && ch <= 'Z' ? static_cast<char>(ch + ('a' - 'A')) : ch; }

}  // namespace routepat
