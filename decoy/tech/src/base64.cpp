#include "decoy/base64.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace decoy {

namespace {

constexpr std::string_view kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr uint32_t Byte(std::string_view data, std::size_t pos) {
  return pos < data.size() ? static_cast<uint8_t>(data[pos]) : 0U;
}

}  // namespace

void B64Encode(std::string_view data, char* out) noexcept {
  for (std::size_t pos = 0; pos < data.size(); pos += 3) {
    const uint32_t group = (Byte(data, pos) << 16) | (Byte(data, pos + 1) << 8) | Byte(data, pos + 2);
    const std::size_t nbBytes = data.size() - pos;
    out[0] = kAlphabet[(group >> 18) & 0x3F];
    out[1] = kAlphabet[(group >> 12) & 0x3F];
    out[2] = nbBytes > 1 ? kAlphabet[(group >> 6) & 0x3F] : '=';
    out[3] = nbBytes > 2 ? kAlphabet[group & 0x3F] : '=';
    out += 4;
  }
}

std::string B64Encode(std::string_view data) {
  std::string ret(B64EncodedLen(data.size()), '\0');
  B64Encode(data, ret.data());
  return ret;
}

}  // namespace decoy
