#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace decoy {

// Content codings known to decoy. Declaration order is the default server preference.
enum class Encoding : uint8_t { zstd, br, gzip, deflate, none };

inline constexpr std::size_t kNbEncodings = static_cast<std::size_t>(Encoding::none) + 1;

// Token used in Content-Encoding and Accept-Encoding headers. Encoding::none is "identity".
[[nodiscard]] std::string_view EncodingToken(Encoding encoding) noexcept;

// Case-insensitive, surrounding whitespace ignored. std::nullopt for tokens decoy does not know.
[[nodiscard]] std::optional<Encoding> EncodingFromToken(std::string_view token) noexcept;

// Whether a codec for 'encoding' is compiled in. Always true for Encoding::none.
[[nodiscard]] bool IsEncodingEnabled(Encoding encoding) noexcept;

}  // namespace decoy
