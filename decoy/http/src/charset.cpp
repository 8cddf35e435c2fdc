#include "decoy/charset.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include "decoy/ascii.hpp"
#include "decoy/http-constants.hpp"

namespace decoy {

namespace {

enum class Charset : int8_t { utf8, usAscii, latin1 };

Charset ParseCharset(std::string_view charset) {
  if (charset.empty() || CaseInsensitiveEqual(charset, http::CharsetUtf8) || CaseInsensitiveEqual(charset, "utf8")) {
    return Charset::utf8;
  }
  if (CaseInsensitiveEqual(charset, http::CharsetUsAscii) || CaseInsensitiveEqual(charset, "ascii")) {
    return Charset::usAscii;
  }
  if (CaseInsensitiveEqual(charset, http::CharsetIso88591) || CaseInsensitiveEqual(charset, "latin1")) {
    return Charset::latin1;
  }
  throw std::invalid_argument(fmt::format("Unsupported charset '{}'", charset));
}

bool IsAscii(std::string_view bytes) {
  return std::ranges::all_of(bytes, [](char ch) { return static_cast<unsigned char>(ch) < 0x80U; });
}

}  // namespace

bool IsValidUtf8(std::string_view text) noexcept {
  const auto* ptr = reinterpret_cast<const unsigned char*>(text.data());
  const auto* end = ptr + text.size();
  while (ptr != end) {
    const unsigned char lead = *ptr;
    std::size_t nbContinuation;
    uint32_t codePoint;
    if (lead < 0x80U) {
      ++ptr;
      continue;
    }
    if ((lead & 0xE0U) == 0xC0U) {
      nbContinuation = 1;
      codePoint = lead & 0x1FU;
    } else if ((lead & 0xF0U) == 0xE0U) {
      nbContinuation = 2;
      codePoint = lead & 0x0FU;
    } else if ((lead & 0xF8U) == 0xF0U) {
      nbContinuation = 3;
      codePoint = lead & 0x07U;
    } else {
      return false;
    }
    if (static_cast<std::size_t>(end - ptr) <= nbContinuation) {
      return false;
    }
    for (std::size_t pos = 1; pos <= nbContinuation; ++pos) {
      if ((ptr[pos] & 0xC0U) != 0x80U) {
        return false;
      }
      codePoint = (codePoint << 6) | (ptr[pos] & 0x3FU);
    }
    static constexpr uint32_t kMinCodePoint[] = {0, 0x80, 0x800, 0x10000};
    if (codePoint < kMinCodePoint[nbContinuation] || codePoint > 0x10FFFFU ||
        (codePoint >= 0xD800U && codePoint <= 0xDFFFU)) {
      return false;
    }
    ptr += nbContinuation + 1;
  }
  return true;
}

std::string ToUtf8(std::string_view bytes, std::string_view charset) {
  switch (ParseCharset(charset)) {
    case Charset::utf8:
      if (!IsValidUtf8(bytes)) {
        throw std::invalid_argument("Invalid UTF-8 sequence");
      }
      return std::string(bytes);
    case Charset::usAscii:
      if (!IsAscii(bytes)) {
        throw std::invalid_argument("Non ASCII byte in us-ascii content");
      }
      return std::string(bytes);
    case Charset::latin1: {
      std::string ret;
      ret.reserve(bytes.size() + bytes.size() / 4U);
      for (char ch : bytes) {
        const auto byte = static_cast<unsigned char>(ch);
        if (byte < 0x80U) {
          ret.push_back(ch);
        } else {
          ret.push_back(static_cast<char>(0xC0U | (byte >> 6)));
          ret.push_back(static_cast<char>(0x80U | (byte & 0x3FU)));
        }
      }
      return ret;
    }
    default:
      throw std::invalid_argument("Unsupported charset");
  }
}

std::string FromUtf8(std::string_view text, std::string_view charset) {
  switch (ParseCharset(charset)) {
    case Charset::utf8:
      return std::string(text);
    case Charset::usAscii:
      if (!IsAscii(text)) {
        throw std::invalid_argument("Text is not representable in us-ascii");
      }
      return std::string(text);
    case Charset::latin1: {
      if (!IsValidUtf8(text)) {
        throw std::invalid_argument("Invalid UTF-8 sequence");
      }
      std::string ret;
      ret.reserve(text.size());
      for (std::size_t pos = 0; pos < text.size(); ++pos) {
        const auto byte = static_cast<unsigned char>(text[pos]);
        if (byte < 0x80U) {
          ret.push_back(text[pos]);
        } else if ((byte & 0xE0U) == 0xC0U && byte <= 0xC3U) {
          ret.push_back(static_cast<char>(((byte & 0x03U) << 6) | (static_cast<unsigned char>(text[pos + 1]) & 0x3FU)));
          ++pos;
        } else {
          throw std::invalid_argument("Text is not representable in iso-8859-1");
        }
      }
      return ret;
    }
    default:
      throw std::invalid_argument("Unsupported charset");
  }
}

}  // namespace decoy
