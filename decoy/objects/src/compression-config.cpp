#include "decoy/compression-config.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <optional>
#include <stdexcept>

#include "decoy/compressor.hpp"
#include "decoy/encoding.hpp"

namespace decoy {

void CompressionDirective::validate() const {
  if (!IsEncodingEnabled(encoding)) {
    throw std::invalid_argument(fmt::format("Encoding {} is not available in this build", EncodingToken(encoding)));
  }
  if (!level) {
    return;
  }
  const auto bounds = CompressionLevelBounds(encoding);
  if (!bounds) {
    throw std::invalid_argument(fmt::format("Encoding {} takes no compression level", EncodingToken(encoding)));
  }
  if (*level < bounds->min || *level > bounds->max) {
    throw std::invalid_argument(fmt::format("Invalid {} compression level {}, expected a value in [{}, {}]",
                                            EncodingToken(encoding), *level, bounds->min, bounds->max));
  }
}

void CompressionConfig::validate() const {
  for (Encoding encoding : preferredFormats) {
    if (!IsEncodingEnabled(encoding)) {
      throw std::invalid_argument(
          fmt::format("Unsupported encoding {} in preferred formats", EncodingToken(encoding)));
    }
  }
  for (const auto& directive : levels) {
    directive.validate();
  }
}

std::optional<int> CompressionConfig::levelOf(Encoding encoding) const noexcept {
  auto it = std::ranges::find(levels, encoding, &CompressionDirective::encoding);
  return it == levels.end() ? std::nullopt : it->level;
}

CompressionConfig& CompressionConfig::withLevel(Encoding encoding, int level) {
  auto it = std::ranges::find(levels, encoding, &CompressionDirective::encoding);
  if (it == levels.end()) {
    levels.push_back(CompressionDirective{encoding, level});
  } else {
    it->level = level;
  }
  return *this;
}

}  // namespace decoy
