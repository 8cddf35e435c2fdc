#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "decoy/compression-config.hpp"
#include "decoy/http-constants.hpp"
#include "decoy/http-status-code.hpp"

namespace decoy {

struct MockServerConfig {
  // ============================
  // Listener parameters
  // ============================
  // Port the listener should bind. 0 (default) lets the listener pick an ephemeral one, retrieve the effective
  // port with MockServer::port() once started.
  uint16_t port{0};

  // Number of worker threads of the listener. Requests and WebSocket messages are dispatched concurrently on them.
  uint32_t nbThreads{4};

  // Whether the listener is the encrypted one. Requests dispatched by it are flagged as secure.
  bool secure{false};

  // ============================
  // Fallback response
  // ============================
  // Response rendered when no expectation matches a request.
  http::StatusCode noMatchStatus{http::StatusCodeNotFound};
  std::string noMatchBody;
  std::string noMatchContentType{http::ContentTypeTextPlain};

  // ============================
  // Verification & diagnostics
  // ============================
  // Upper bound between two re-checks of the call counters in verify(timeout). Counter changes wake up the
  // verifier immediately; this bound only limits the latency of time-based predicates.
  std::chrono::milliseconds verifyPollInterval{50};

  // If true, the mismatch report summary is logged (debug level) each time a request matches no expectation.
  bool logMismatchReports{true};

  // ============================
  // Bodies
  // ============================
  // Maximum size of an inflated request body (Content-Encoding: gzip / deflate). 0 means unlimited.
  std::size_t maxDecompressedBodyBytes{16UL << 20};

  // Response compression negotiation.
  CompressionConfig compression;

  MockServerConfig& withPort(uint16_t port);

  MockServerConfig& withNbThreads(uint32_t nbThreads);

  MockServerConfig& withSecure(bool secure = true);

  MockServerConfig& withNoMatchStatus(http::StatusCode status);

  MockServerConfig& withNoMatchBody(std::string_view body, std::string_view contentType = http::ContentTypeTextPlain);

  MockServerConfig& withVerifyPollInterval(std::chrono::milliseconds interval);

  MockServerConfig& withLogMismatchReports(bool on = true);

  MockServerConfig& withMaxDecompressedBodyBytes(std::size_t maxBytes);

  MockServerConfig& withCompression(CompressionConfig compressionConfig);

  // Throws std::invalid_argument on invalid values.
  void validate() const;
};

}  // namespace decoy
