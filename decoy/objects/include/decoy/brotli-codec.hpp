#pragma once

#include <memory>
#include <optional>

#include "decoy/compressor.hpp"

namespace decoy {

// Brotli calls its level 'quality'.
[[nodiscard]] LevelBounds BrotliLevelBounds() noexcept;

[[nodiscard]] std::unique_ptr<Compressor> MakeBrotliCompressor(std::optional<int> level);

}  // namespace decoy
