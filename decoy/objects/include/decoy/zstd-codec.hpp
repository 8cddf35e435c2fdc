#pragma once

#include <memory>
#include <optional>

#include "decoy/compressor.hpp"

namespace decoy {

[[nodiscard]] LevelBounds ZstdLevelBounds() noexcept;

[[nodiscard]] std::unique_ptr<Compressor> MakeZstdCompressor(std::optional<int> level);

}  // namespace decoy
