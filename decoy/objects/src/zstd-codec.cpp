#include "decoy/zstd-codec.hpp"

#include <spdlog/fmt/fmt.h>
#include <zstd.h>

#include <cstddef>
#include <memory>
#include <new>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "decoy/compressor.hpp"

namespace decoy {

namespace {

std::size_t Check(std::size_t result, std::string_view operation) {
  if (ZSTD_isError(result) != 0U) {
    throw std::runtime_error(fmt::format("zstd {} failed: {}", operation, ZSTD_getErrorName(result)));
  }
  return result;
}

class ZstdCompressor final : public Compressor {
 public:
  explicit ZstdCompressor(int level) : _ctx(ZSTD_createCCtx(), &ZSTD_freeCCtx) {
    if (!_ctx) {
      throw std::bad_alloc();
    }
    Check(ZSTD_CCtx_setParameter(_ctx.get(), ZSTD_c_compressionLevel, level), "level setting");
  }

  // Each call closing the stream ends the current frame, a following call starts a new one.
  void feed(std::string_view data, bool last, std::string& out) override {
    ZSTD_inBuffer input{data.data(), data.size(), 0};
    const ZSTD_EndDirective mode = last ? ZSTD_e_end : ZSTD_e_flush;
    std::size_t nbPending;
    do {
      const std::size_t oldSize = out.size();
      const std::size_t room = ZSTD_CStreamOutSize();
      out.resize(oldSize + room);
      ZSTD_outBuffer output{out.data() + oldSize, room, 0};
      nbPending = Check(ZSTD_compressStream2(_ctx.get(), &output, &input, mode), "compression");
      out.resize(oldSize + output.pos);
    } while (nbPending != 0);
  }

 private:
  std::unique_ptr<ZSTD_CCtx, decltype(&ZSTD_freeCCtx)> _ctx;
};

}  // namespace

LevelBounds ZstdLevelBounds() noexcept { return {ZSTD_minCLevel(), ZSTD_maxCLevel()}; }

std::unique_ptr<Compressor> MakeZstdCompressor(std::optional<int> level) {
  return std::make_unique<ZstdCompressor>(level.value_or(ZSTD_CLEVEL_DEFAULT));
}

}  // namespace decoy
