#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "decoy/encoding.hpp"
#include "decoy/vector.hpp"

namespace decoy {

// What to compress a response body with. Without level, the codec default is used.
struct CompressionDirective {
  Encoding encoding{Encoding::none};
  std::optional<int> level;

  // Throws std::invalid_argument if 'encoding' is not compiled in or if 'level' is out of its codec bounds.
  void validate() const;

  bool operator==(const CompressionDirective&) const noexcept = default;
};

// Response compression negotiation parameters.
// Codecs are optional at build time: an encoding that is not compiled in is never negotiated, and naming it in
// 'preferredFormats' or 'levels' is a configuration error.
struct CompressionConfig {
  // Throws std::invalid_argument on the first invalid field.
  void validate() const;

  // Level configured for 'encoding', if any.
  [[nodiscard]] std::optional<int> levelOf(Encoding encoding) const noexcept;

  // Directive to apply once 'encoding' has been negotiated.
  [[nodiscard]] CompressionDirective directiveFor(Encoding encoding) const noexcept {
    return {encoding, levelOf(encoding)};
  }

  // Sets (or replaces) the level of 'encoding'.
  CompressionConfig& withLevel(Encoding encoding, int level);

  // Server preference among formats accepted with the same quality. Empty means Encoding declaration order.
  vector<Encoding> preferredFormats;

  // At most one directive per encoding, see withLevel().
  vector<CompressionDirective> levels;

  // Adds Accept-Encoding to the Vary header of compressed responses.
  bool addVaryHeader{true};

  // Bodies smaller than this are sent uncompressed.
  std::size_t minBytes{0};

  // Content-type prefixes (case-insensitive) eligible for compression. Empty means any.
  vector<std::string> contentTypeAllowList;
};

}  // namespace decoy
