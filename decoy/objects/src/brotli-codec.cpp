#include "decoy/brotli-codec.hpp"

#include <brotli/encode.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <new>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "decoy/compressor.hpp"

namespace decoy {

namespace {

class BrotliCompressor final : public Compressor {
 public:
  explicit BrotliCompressor(int quality)
      : _state(BrotliEncoderCreateInstance(nullptr, nullptr, nullptr), &BrotliEncoderDestroyInstance) {
    if (!_state) {
      throw std::bad_alloc();
    }
    if (BrotliEncoderSetParameter(_state.get(), BROTLI_PARAM_QUALITY, static_cast<uint32_t>(quality)) == BROTLI_FALSE) {
      throw std::runtime_error("Unable to set brotli quality");
    }
  }

  void feed(std::string_view data, bool last, std::string& out) override {
    if (BrotliEncoderIsFinished(_state.get()) == BROTLI_TRUE) {
      throw std::runtime_error("brotli stream already finished");
    }
    const BrotliEncoderOperation operation = last ? BROTLI_OPERATION_FINISH : BROTLI_OPERATION_FLUSH;
    std::size_t availIn = data.size();
    const auto* nextIn = reinterpret_cast<const uint8_t*>(data.data());
    do {
      std::size_t availOut = 0;
      if (BrotliEncoderCompressStream(_state.get(), operation, &availIn, &nextIn, &availOut, nullptr, nullptr) ==
          BROTLI_FALSE) {
        throw std::runtime_error("brotli compression failed");
      }
      std::size_t size = 0;
      const uint8_t* produced = BrotliEncoderTakeOutput(_state.get(), &size);
      out.append(reinterpret_cast<const char*>(produced), size);
    } while (availIn != 0 || BrotliEncoderHasMoreOutput(_state.get()) == BROTLI_TRUE ||
             (last && BrotliEncoderIsFinished(_state.get()) == BROTLI_FALSE));
  }

 private:
  std::unique_ptr<BrotliEncoderState, decltype(&BrotliEncoderDestroyInstance)> _state;
};

}  // namespace

LevelBounds BrotliLevelBounds() noexcept { return {BROTLI_MIN_QUALITY, BROTLI_MAX_QUALITY}; }

std::unique_ptr<Compressor> MakeBrotliCompressor(std::optional<int> level) {
  return std::make_unique<BrotliCompressor>(level.value_or(BROTLI_DEFAULT_QUALITY));
}

}  // namespace decoy
