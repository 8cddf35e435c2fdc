#include "decoy/compressor.hpp"

#include <spdlog/fmt/fmt.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "decoy/compression-config.hpp"
#include "decoy/encoding.hpp"

#ifdef DECOY_ENABLE_ZLIB
#include "decoy/zlib-codec.hpp"
#endif
#ifdef DECOY_ENABLE_ZSTD
#include "decoy/zstd-codec.hpp"
#endif
#ifdef DECOY_ENABLE_BROTLI
#include "decoy/brotli-codec.hpp"
#endif

namespace decoy {

std::optional<LevelBounds> CompressionLevelBounds(Encoding encoding) noexcept {
  switch (encoding) {
#ifdef DECOY_ENABLE_ZLIB
    case Encoding::gzip:
    case Encoding::deflate:
      return ZlibLevelBounds();
#endif
#ifdef DECOY_ENABLE_ZSTD
    case Encoding::zstd:
      return ZstdLevelBounds();
#endif
#ifdef DECOY_ENABLE_BROTLI
    case Encoding::br:
      return BrotliLevelBounds();
#endif
    default:
      return std::nullopt;
  }
}

std::unique_ptr<Compressor> MakeCompressor(const CompressionDirective& directive) {
  switch (directive.encoding) {
#ifdef DECOY_ENABLE_ZLIB
    case Encoding::gzip:
      return MakeZlibCompressor(true, directive.level);
    case Encoding::deflate:
      return MakeZlibCompressor(false, directive.level);
#endif
#ifdef DECOY_ENABLE_ZSTD
    case Encoding::zstd:
      return MakeZstdCompressor(directive.level);
#endif
#ifdef DECOY_ENABLE_BROTLI
    case Encoding::br:
      return MakeBrotliCompressor(directive.level);
#endif
    default:
      return nullptr;
  }
}

std::string CompressAll(const CompressionDirective& directive, std::string_view data) {
  auto compressor = MakeCompressor(directive);
  if (!compressor) {
    throw std::invalid_argument(fmt::format("No compressor for encoding {}", EncodingToken(directive.encoding)));
  }
  std::string out;
  compressor->feed(data, true, out);
  return out;
}

}  // namespace decoy
