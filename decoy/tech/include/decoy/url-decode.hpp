#pragma once

#include <string>
#include <string_view>

namespace decoy::url {

// Decodes percent-encoded sequences of 'encoded'. When plusAsSpace is true, '+' is translated to a space
// (application/x-www-form-urlencoded semantics, to be used for query and form components only, not for paths).
// Malformed escapes (truncated '%' or non-hex digits) are kept verbatim.
[[nodiscard]] std::string DecodeComponent(std::string_view encoded, bool plusAsSpace);

// Calls 'onPair(key, value)' for each '&' separated pair of 'query', both decoded with form semantics.
//  - Missing '=' => value = "".
//  - Empty pairs ("a=1&&b=2") are skipped.
//  - Duplicates are reported in order.
template <class Callback>
void ForEachFormPair(std::string_view query, Callback&& onPair) {
  while (!query.empty()) {
    const auto pairEnd = query.find('&');
    std::string_view pair = query.substr(0, pairEnd);
    query = pairEnd == std::string_view::npos ? std::string_view{} : query.substr(pairEnd + 1);
    if (pair.empty()) {
      continue;
    }
    const auto eq = pair.find('=');
    if (eq == std::string_view::npos) {
      onPair(DecodeComponent(pair, true), std::string{});
    } else {
      onPair(DecodeComponent(pair.substr(0, eq), true), DecodeComponent(pair.substr(eq + 1), true));
    }
  }
}

}  // namespace decoy::url
