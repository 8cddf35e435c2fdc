#pragma once

#include <algorithm>
#include <string>
#include <string_view>

namespace decoy {

// Locale independent, only 'A'-'Z' are changed.
constexpr char AsciiLower(char ch) noexcept { return ch >= 'A' && ch <= 'Z' ? static_cast<char>(ch + ('a' - 'A')) : ch; }

inline std::string AsciiLowerCopy(std::string_view str) {
  std::string ret(str.size(), '\0');
  std::ranges::transform(str, ret.begin(), AsciiLower);
  return ret;
}

// Header names, tokens and media types compare this way.
constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) noexcept {
  return std::ranges::equal(lhs, rhs, [](char lch, char rch) { return AsciiLower(lch) == AsciiLower(rch); });
}

constexpr bool StartsWithCaseInsensitive(std::string_view value, std::string_view prefix) noexcept {
  return value.size() >= prefix.size() && CaseInsensitiveEqual(value.substr(0, prefix.size()), prefix);
}

}  // namespace decoy
