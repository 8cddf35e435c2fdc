#pragma once

#include <string>
#include <string_view>

namespace decoy {

// Converts 'bytes' encoded in 'charset' to UTF-8. Supported charsets: utf-8 (and utf8), us-ascii, iso-8859-1
// (and latin1). An empty charset is considered as utf-8.
// Throws std::invalid_argument for unsupported charsets, for non ASCII bytes in us-ascii and for invalid UTF-8.
[[nodiscard]] std::string ToUtf8(std::string_view bytes, std::string_view charset);

// Converts UTF-8 'text' to 'charset'. Same supported charsets as ToUtf8.
// Throws std::invalid_argument for unsupported charsets and for characters not representable in 'charset'.
[[nodiscard]] std::string FromUtf8(std::string_view text, std::string_view charset);

[[nodiscard]] bool IsValidUtf8(std::string_view text) noexcept;

}  // namespace decoy
