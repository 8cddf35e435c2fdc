#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "decoy/compressor.hpp"

namespace decoy {

[[nodiscard]] LevelBounds ZlibLevelBounds() noexcept;

// 'gzip' selects the gzip wrapper (RFC 1952), the zlib one (RFC 1950, the HTTP 'deflate' coding) otherwise.
[[nodiscard]] std::unique_ptr<Compressor> MakeZlibCompressor(bool gzip, std::optional<int> level);

// Appends the inflated 'input' to 'out'.
// Returns false on corrupted or truncated input, on trailing bytes after the stream end, and when more than
// 'maxBytes' would be produced (0 means unlimited). 'out' content is unspecified on failure.
[[nodiscard]] bool ZlibInflate(std::string_view input, bool gzip, std::size_t maxBytes, std::string& out);

}  // namespace decoy
