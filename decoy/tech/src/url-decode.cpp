#include "decoy/url-decode.hpp"

#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace decoy::url {

std::string DecodeComponent(std::string_view encoded, bool plusAsSpace) {
  std::string out;
  out.reserve(encoded.size());
  for (std::size_t pos = 0; pos < encoded.size(); ++pos) {
    const char ch = encoded[pos];
    switch (ch) {
      case '+':
        out.push_back(plusAsSpace ? ' ' : '+');
        break;
      case '%': {
        if (pos + 2 >= encoded.size()) {
          out.push_back('%');
          break;
        }
        const char* first = encoded.data() + pos + 1;
        uint8_t byte = 0;
        const auto [ptr, ec] = std::from_chars(first, first + 2, byte, 16);
        if (ec != std::errc() || ptr != first + 2) {
          out.push_back('%');
          break;
        }
        out.push_back(static_cast<char>(byte));
        pos += 2;
        break;
      }
      default:
        out.push_back(ch);
        break;
    }
  }
  return out;
}

}  // namespace decoy::url
