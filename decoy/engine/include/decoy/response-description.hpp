#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "decoy/compression-config.hpp"
#include "decoy/http-status-code.hpp"
#include "decoy/named-value.hpp"
#include "decoy/vector.hpp"

namespace decoy {

struct StreamChunk {
  std::string data;
  // Pause after this chunk is written.
  std::chrono::milliseconds delayAfter{0};
};

// Timed writes of a response body, executed by the listener.
struct StreamPlan {
  // Pause before the first byte of the response.
  std::chrono::milliseconds initialDelay{0};
  vector<StreamChunk> chunks;

  [[nodiscard]] std::chrono::milliseconds totalDelay() const noexcept;

  // Concatenation of all chunks.
  [[nodiscard]] std::string body() const;
};

// Instruction to relay the request to an upstream server and to send back its response verbatim.
struct ForwardDirective {
  // Upstream base URL followed by the original path and query.
  std::string url;
  std::string method;
  // Original headers, hop-by-hop ones removed.
  NamedValues headers;
  std::string body;
};

// What the listener has to send back for one request.
struct ResponseDescription {
  http::StatusCode status{http::StatusCodeOK};
  NamedValues headers;
  // Whole body. Empty when 'streamPlan' is set, the body is then held by the chunks.
  std::string body;
  std::optional<StreamPlan> streamPlan;
  // When set, the other fields are not meaningful.
  std::optional<ForwardDirective> forward;
  // Only sent with chunked responses.
  NamedValues trailers;
  // Compression to apply with ApplyCompression, negotiated with the client or imposed by the responder.
  CompressionDirective compression;

  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept {
    return FindFirstValue(headers, name, true);
  }

  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view name) const noexcept {
    return headerValue(name).value_or(std::string_view{});
  }

  [[nodiscard]] bool isChunked() const noexcept { return streamPlan.has_value(); }
};

}  // namespace decoy
