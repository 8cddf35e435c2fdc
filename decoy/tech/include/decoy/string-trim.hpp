#pragma once

#include <string_view>

namespace decoy {

// Optional whitespace of HTTP grammars (RFC 9110 section 5.6.3) is SP and HTAB only.
constexpr std::string_view TrimOws(std::string_view sv) noexcept {
  constexpr std::string_view kOws = " \t";
  const auto first = sv.find_first_not_of(kOws);
  if (first == std::string_view::npos) {
    return {};
  }
  return sv.substr(first, sv.find_last_not_of(kOws) - first + 1);
}

// Removes one pair of enclosing double quotes, if any.
constexpr std::string_view StripQuotes(std::string_view value) noexcept {
  if (value.size() >= 2 && value.starts_with('"') && value.ends_with('"')) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

}  // namespace decoy
