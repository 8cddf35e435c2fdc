#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "decoy/compression-config.hpp"
#include "decoy/encoding.hpp"

namespace decoy {

// One compressed stream. Feed it the body in one or several pieces: every call appends to 'out' the bytes
// produced so far, flushed so that a client can already decode them, and the call with 'last' set closes the
// stream. Not thread-safe, one instance per response.
// Throws std::runtime_error on codec failures.
class Compressor {
 public:
  virtual ~Compressor() = default;

  virtual void feed(std::string_view data, bool last, std::string& out) = 0;
};

struct LevelBounds {
  int min;
  int max;
};

// Accepted levels of the codec of 'encoding', std::nullopt for Encoding::none and codecs not compiled in.
[[nodiscard]] std::optional<LevelBounds> CompressionLevelBounds(Encoding encoding) noexcept;

// Compressor executing 'directive', nullptr for Encoding::none and codecs not compiled in.
[[nodiscard]] std::unique_ptr<Compressor> MakeCompressor(const CompressionDirective& directive);

// Compresses 'data' as a single piece.
// Throws std::invalid_argument if the encoding of 'directive' is not available.
[[nodiscard]] std::string CompressAll(const CompressionDirective& directive, std::string_view data);

}  // namespace decoy
