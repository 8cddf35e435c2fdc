#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "decoy/accept-encoding-negotiation.hpp"
#include "decoy/compression-config.hpp"
#include "decoy/expectation.hpp"
#include "decoy/http-status-code.hpp"
#include "decoy/request-view.hpp"
#include "decoy/responder.hpp"
#include "decoy/response-description.hpp"
#include "decoy/vector.hpp"

namespace decoy {

// Builds the response of a matched expectation.
// Safe to call concurrently: it only reads the expectation, whose responder is selected by the call index obtained
// when the call was counted.
class ResponseSynthesizer {
 public:
  explicit ResponseSynthesizer(CompressionConfig compressionConfig = {});

  // Builds the response of call 'callIndex' (1-based) of 'expectation' for 'request'.
  // Never throws: a failure while encoding the body gives a 500 response carrying the error message.
  [[nodiscard]] ResponseDescription synthesize(const Expectation& expectation, uint64_t callIndex,
                                               const RequestView& request) const;

  // Response rendered when a request matches no expectation.
  [[nodiscard]] static ResponseDescription NoMatch(http::StatusCode status, std::string_view body,
                                                   std::string_view contentType);

  // Splits 'body' into at most 'nbChunks' non empty parts whose sizes differ by at most one byte.
  // An empty body gives a single empty part.
  [[nodiscard]] static vector<std::string> SplitBalanced(std::string_view body, uint32_t nbChunks);

  // Draws a delay uniformly in [delay.min, delay.max].
  [[nodiscard]] static std::chrono::milliseconds DrawDelay(const DelaySpec& delay);

  [[nodiscard]] const CompressionConfig& compressionConfig() const noexcept { return _compressionConfig; }

 private:
  void buildContent(const Expectation& expectation, const Responder& responder, ResponseDescription& response) const;

  void negotiateCompression(const Responder& responder, const RequestView& request,
                            ResponseDescription& response) const;

  static void BuildStreamPlan(const Responder& responder, ResponseDescription& response);

  static ResponseDescription Forward(const Responder::ForwardPayload& forward, const RequestView& request);

  CompressionConfig _compressionConfig;
  EncodingSelector _encodingSelector;
};

// Executes the compression directive of 'response': compresses its body, or its chunks as one compressed stream
// flushed at the end of each chunk, and adds the Content-Encoding (and Vary) headers.
// No-op without directive.
void ApplyCompression(ResponseDescription& response, const CompressionConfig& compressionConfig);

}  // namespace decoy
