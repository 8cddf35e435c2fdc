#include "decoy/zlib-codec.hpp"

#include <spdlog/fmt/fmt.h>
#include <zlib.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "decoy/compressor.hpp"
#include "decoy/log.hpp"

namespace decoy {

namespace {

constexpr int WindowBits(bool gzip) { return gzip ? MAX_WBITS + 16 : MAX_WBITS; }

Bytef* InputBytes(std::string_view data) { return reinterpret_cast<Bytef*>(const_cast<char*>(data.data())); }

class ZlibCompressor final : public Compressor {
 public:
  ZlibCompressor(bool gzip, int level) {
    const int ret = deflateInit2(&_stream, level, Z_DEFLATED, WindowBits(gzip), 8, Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) {
      throw std::runtime_error(fmt::format("deflateInit2 failed with error {}", ret));
    }
  }

  ZlibCompressor(const ZlibCompressor&) = delete;
  ZlibCompressor& operator=(const ZlibCompressor&) = delete;

  // Z_DATA_ERROR only tells that the stream was not finished.
  ~ZlibCompressor() override { deflateEnd(&_stream); }

  void feed(std::string_view data, bool last, std::string& out) override {
    if (_finished) {
      throw std::runtime_error("zlib stream already finished");
    }
    _stream.next_in = InputBytes(data);
    _stream.avail_in = static_cast<uInt>(data.size());
    const int flush = last ? Z_FINISH : Z_SYNC_FLUSH;
    int ret;
    do {
      const std::size_t oldSize = out.size();
      const std::size_t room = std::max<std::size_t>(deflateBound(&_stream, _stream.avail_in), 64U);
      out.resize(oldSize + room);
      _stream.next_out = reinterpret_cast<Bytef*>(out.data() + oldSize);
      _stream.avail_out = static_cast<uInt>(room);
      ret = deflate(&_stream, flush);
      out.resize(oldSize + room - _stream.avail_out);
      if (ret != Z_OK && ret != Z_STREAM_END && ret != Z_BUF_ERROR) {
        throw std::runtime_error(fmt::format("deflate failed with error {}", ret));
      }
    } while (last ? ret != Z_STREAM_END : _stream.avail_out == 0);
    _finished = last;
  }

 private:
  z_stream _stream{};
  bool _finished{false};
};

}  // namespace

LevelBounds ZlibLevelBounds() noexcept { return {Z_NO_COMPRESSION, Z_BEST_COMPRESSION}; }

std::unique_ptr<Compressor> MakeZlibCompressor(bool gzip, std::optional<int> level) {
  return std::make_unique<ZlibCompressor>(gzip, level.value_or(Z_DEFAULT_COMPRESSION));
}

bool ZlibInflate(std::string_view input, bool gzip, std::size_t maxBytes, std::string& out) {
  z_stream stream{};
  if (const int ret = inflateInit2(&stream, WindowBits(gzip)); ret != Z_OK) {
    log::error("inflateInit2 failed with error {}", ret);
    return false;
  }
  std::unique_ptr<z_stream, decltype(&inflateEnd)> guard(&stream, &inflateEnd);
  stream.next_in = InputBytes(input);
  stream.avail_in = static_cast<uInt>(input.size());

  const std::size_t limit = maxBytes == 0 ? std::numeric_limits<std::size_t>::max() : maxBytes;
  std::size_t nbProduced = 0;
  std::array<char, 16384> buffer;
  while (true) {
    stream.next_out = reinterpret_cast<Bytef*>(buffer.data());
    stream.avail_out = static_cast<uInt>(buffer.size());
    const int ret = inflate(&stream, Z_NO_FLUSH);
    const std::size_t produced = buffer.size() - stream.avail_out;
    if (produced > limit - nbProduced) {
      log::debug("Inflated body exceeds {} bytes", limit);
      return false;
    }
    nbProduced += produced;
    out.append(buffer.data(), produced);
    if (ret == Z_STREAM_END) {
      return stream.avail_in == 0;
    }
    if (ret != Z_OK) {
      // Z_BUF_ERROR here means the input ended before the stream
      log::debug("inflate stopped with error {}", ret);
      return false;
    }
  }
}

}  // namespace decoy
