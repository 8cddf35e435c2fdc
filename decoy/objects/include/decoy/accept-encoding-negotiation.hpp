#pragma once

#include <string_view>

#include "decoy/compression-config.hpp"
#include "decoy/encoding.hpp"
#include "decoy/vector.hpp"

namespace decoy {

// Chooses the response content coding from an Accept-Encoding header (RFC 9110 section 12.5.3), among the codecs
// compiled in this build.
class EncodingSelector {
 public:
  // Server preference is 'preferredFormats', or Encoding declaration order when it is empty.
  explicit EncodingSelector(const CompressionConfig& compressionConfig = {});

  struct NegotiatedResult {
    Encoding encoding{Encoding::none};
    // Identity is forbidden ('identity;q=0', or '*;q=0' without identity) and no coding is acceptable.
    bool reject{false};
  };

  // Highest quality wins, server preference breaks ties. A token lists an encoding with an optional 'q' parameter
  // (1 by default, 0 when malformed). '*' gives its quality to every encoding not listed. Quality 0 means
  // not acceptable. Unknown tokens are ignored.
  [[nodiscard]] NegotiatedResult negotiateAcceptEncoding(std::string_view acceptEncoding) const;

 private:
  vector<Encoding> _preference;
};

}  // namespace decoy
