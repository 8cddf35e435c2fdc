#include "decoy/encoding.hpp"

#include <optional>
#include <string_view>

#include "decoy/ascii.hpp"
#include "decoy/http-constants.hpp"
#include "decoy/string-trim.hpp"

namespace decoy {

std::string_view EncodingToken(Encoding encoding) noexcept {
  switch (encoding) {
    case Encoding::zstd:
      return http::zstd;
    case Encoding::br:
      return http::br;
    case Encoding::gzip:
      return http::gzip;
    case Encoding::deflate:
      return http::deflate;
    default:
      return http::identity;
  }
}

std::optional<Encoding> EncodingFromToken(std::string_view token) noexcept {
  token = TrimOws(token);
  for (std::size_t pos = 0; pos < kNbEncodings; ++pos) {
    const auto encoding = static_cast<Encoding>(pos);
    if (CaseInsensitiveEqual(token, EncodingToken(encoding))) {
      return encoding;
    }
  }
  return std::nullopt;
}

bool IsEncodingEnabled(Encoding encoding) noexcept {
  switch (encoding) {
    case Encoding::gzip:
    case Encoding::deflate:
#ifdef DECOY_ENABLE_ZLIB
      return true;
#else
      return false;
#endif
    case Encoding::zstd:
#ifdef DECOY_ENABLE_ZSTD
      return true;
#else
      return false;
#endif
    case Encoding::br:
#ifdef DECOY_ENABLE_BROTLI
      return true;
#else
      return false;
#endif
    default:
      return true;
  }
}

}  // namespace decoy
