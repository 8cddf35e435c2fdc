#include "decoy/compressor.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <string_view>

#include "decoy/compression-config.hpp"
#include "decoy/encoding.hpp"

#ifdef DECOY_ENABLE_ZLIB
#include "decoy/zlib-codec.hpp"
#endif

#ifdef DECOY_ENABLE_ZSTD
#include <zstd.h>
#endif

#ifdef DECOY_ENABLE_BROTLI
#include <brotli/decode.h>
#endif

namespace decoy {

namespace {
std::string MakePayload() {
  std::string payload;
  for (int lineNb = 0; lineNb < 200; ++lineNb) {
    payload.append("{\"id\":").append(std::to_string(lineNb)).append(",\"name\":\"decoy\"}\n");
  }
  return payload;
}

// Feeds 'payload' in 'nbPieces' pieces, the last one closing the stream.
std::string CompressInPieces(const CompressionDirective& directive, std::string_view payload, std::size_t nbPieces) {
  auto compressor = MakeCompressor(directive);
  EXPECT_TRUE(compressor);
  std::string out;
  const std::size_t pieceSize = payload.size() / nbPieces;
  for (std::size_t piece = 0; piece < nbPieces; ++piece) {
    const bool last = piece + 1 == nbPieces;
    compressor->feed(last ? payload.substr(piece * pieceSize) : payload.substr(piece * pieceSize, pieceSize), last,
                     out);
  }
  return out;
}
}  // namespace

TEST(CompressorTest, NoneAndDisabledGiveNoCompressor) {
  EXPECT_TRUE(MakeCompressor(CompressionDirective{}) == nullptr);
  EXPECT_FALSE(CompressionLevelBounds(Encoding::none));
  EXPECT_THROW((void)CompressAll(CompressionDirective{}, "data"), std::invalid_argument);
  for (Encoding encoding : {Encoding::zstd, Encoding::br, Encoding::gzip, Encoding::deflate}) {
    EXPECT_EQ(MakeCompressor(CompressionDirective{encoding, {}}) != nullptr, IsEncodingEnabled(encoding));
    EXPECT_EQ(CompressionLevelBounds(encoding).has_value(), IsEncodingEnabled(encoding));
  }
}

#ifdef DECOY_ENABLE_ZLIB
TEST(CompressorTest, GzipSinglePiece) {
  const auto payload = MakePayload();
  const auto compressed = CompressAll(CompressionDirective{Encoding::gzip, {}}, payload);
  EXPECT_LT(compressed.size(), payload.size());
  // gzip magic
  ASSERT_GE(compressed.size(), 2U);
  EXPECT_EQ(static_cast<uint8_t>(compressed[0]), 0x1FU);
  EXPECT_EQ(static_cast<uint8_t>(compressed[1]), 0x8BU);

  std::string plain;
  ASSERT_TRUE(ZlibInflate(compressed, true, 0, plain));
  EXPECT_EQ(plain, payload);
}

TEST(CompressorTest, DeflateInPiecesIsOneStream) {
  const auto payload = MakePayload();
  const auto compressed = CompressInPieces(CompressionDirective{Encoding::deflate, 9}, payload, 3);
  std::string plain;
  ASSERT_TRUE(ZlibInflate(compressed, false, 0, plain));
  EXPECT_EQ(plain, payload);
}

TEST(CompressorTest, LevelChangesOutput) {
  const auto payload = MakePayload();
  const auto stored = CompressAll(CompressionDirective{Encoding::gzip, 0}, payload);
  const auto best = CompressAll(CompressionDirective{Encoding::gzip, 9}, payload);
  EXPECT_GT(stored.size(), payload.size());
  EXPECT_LT(best.size(), stored.size());
}

TEST(CompressorTest, FinishedZlibStreamRefusesMoreData) {
  auto compressor = MakeCompressor(CompressionDirective{Encoding::gzip, {}});
  std::string out;
  compressor->feed("abc", true, out);
  EXPECT_THROW(compressor->feed("def", true, out), std::runtime_error);
}

TEST(ZlibInflateTest, RejectsGarbage) {
  std::string plain;
  EXPECT_FALSE(ZlibInflate("definitely not gzip", true, 0, plain));
}

TEST(ZlibInflateTest, RejectsTruncated) {
  const auto compressed = CompressAll(CompressionDirective{Encoding::gzip, {}}, MakePayload());
  std::string plain;
  EXPECT_FALSE(ZlibInflate(std::string_view(compressed).substr(0, compressed.size() / 2), true, 0, plain));
}

TEST(ZlibInflateTest, RejectsTrailingBytes) {
  auto compressed = CompressAll(CompressionDirective{Encoding::gzip, {}}, "payload");
  compressed.push_back('x');
  std::string plain;
  EXPECT_FALSE(ZlibInflate(compressed, true, 0, plain));
}

TEST(ZlibInflateTest, EnforcesLimit) {
  const auto payload = MakePayload();
  const auto compressed = CompressAll(CompressionDirective{Encoding::gzip, {}}, payload);
  std::string plain;
  EXPECT_FALSE(ZlibInflate(compressed, true, payload.size() / 4, plain));
  plain.clear();
  EXPECT_TRUE(ZlibInflate(compressed, true, payload.size(), plain));
  EXPECT_EQ(plain, payload);
}
#endif

#ifdef DECOY_ENABLE_ZSTD
TEST(CompressorTest, ZstdSingleAndPieces) {
  const auto payload = MakePayload();
  for (const auto& compressed : {CompressAll(CompressionDirective{Encoding::zstd, 3}, payload),
                                 CompressInPieces(CompressionDirective{Encoding::zstd, {}}, payload, 4)}) {
    std::string plain(payload.size(), '\0');
    const std::size_t size = ZSTD_decompress(plain.data(), plain.size(), compressed.data(), compressed.size());
    ASSERT_EQ(ZSTD_isError(size), 0U);
    plain.resize(size);
    EXPECT_EQ(plain, payload);
  }
}
#endif

#ifdef DECOY_ENABLE_BROTLI
namespace {
std::string BrotliDecompress(std::string_view compressed, std::size_t expectedSize) {
  std::string out(expectedSize, '\0');
  std::size_t decodedSize = out.size();
  const auto res = BrotliDecoderDecompress(compressed.size(), reinterpret_cast<const uint8_t*>(compressed.data()),
                                           &decodedSize, reinterpret_cast<uint8_t*>(out.data()));
  EXPECT_EQ(res, BROTLI_DECODER_RESULT_SUCCESS);
  out.resize(decodedSize);
  return out;
}
}  // namespace

TEST(CompressorTest, BrotliSingleAndPieces) {
  const auto payload = MakePayload();
  EXPECT_EQ(BrotliDecompress(CompressAll(CompressionDirective{Encoding::br, 11}, payload), payload.size()), payload);
  EXPECT_EQ(BrotliDecompress(CompressInPieces(CompressionDirective{Encoding::br, {}}, payload, 4), payload.size()),
            payload);
}
#endif

}  // namespace decoy
