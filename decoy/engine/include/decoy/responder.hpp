#pragma once

#include <any>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "decoy/codec-registry.hpp"
#include "decoy/compression-config.hpp"
#include "decoy/encoding.hpp"
#include "decoy/http-constants.hpp"
#include "decoy/http-status-code.hpp"
#include "decoy/multipart.hpp"
#include "decoy/named-value.hpp"

namespace decoy {

// Delay drawn uniformly in [min, max] each time it is applied. A fixed delay has min == max.
struct DelaySpec {
  std::chrono::milliseconds min{0};
  std::chrono::milliseconds max{0};

  [[nodiscard]] static DelaySpec Fixed(std::chrono::milliseconds delay) noexcept { return {delay, delay}; }

  // Throws std::invalid_argument if 'min' > 'max' or if 'min' is negative.
  [[nodiscard]] static DelaySpec Between(std::chrono::milliseconds min, std::chrono::milliseconds max);

  [[nodiscard]] bool isZero() const noexcept { return max.count() == 0; }

  // Throws std::invalid_argument on negative or inverted bounds.
  void validate() const;

  bool operator==(const DelaySpec&) const noexcept = default;
};

struct ChunkSpec {
  uint32_t nbChunks{1};
  // Delay following each chunk.
  DelaySpec delay;

  bool operator==(const ChunkSpec&) const noexcept = default;
};

enum class ResponderKind : uint8_t { content, forward, multipart };

// Declaration of one response of an expectation: status, headers and body (raw bytes or an object encoded with
// the encoder chain), or a multipart body, or a forward to an upstream server, plus timing (delay, chunks) and
// trailers.
class Responder {
 public:
  using EncodersConfigurator = std::function<void(EncoderRegistry&)>;

  // Content response with given status and an empty body.
  explicit Responder(http::StatusCode status = http::StatusCodeOK) : _status(status) {}

  // Response relayed from 'upstreamBaseUrl' + original path and query.
  // Throws std::invalid_argument if 'upstreamBaseUrl' is not an http or https URL.
  [[nodiscard]] static Responder Forward(std::string_view upstreamBaseUrl);

  Responder& status(http::StatusCode status);

  // Appends a response header. Content-Type is better set through body() or object().
  Responder& header(std::string_view name, std::string_view value);

  // Raw body bytes sent as is.
  Responder& body(std::string_view bytes, std::string_view contentType = http::ContentTypeTextPlain);

  // Body encoded from 'object' with the encoder resolved for ('contentType', T).
  template <class T>
  Responder& object(T object, std::string_view contentType) {
    auto& content = contentPayload();
    content.bytes.clear();
    content.object = std::any(std::move(object));
    content.contentType = contentType;
    return *this;
  }

  // Multipart body. Parts holding an object are encoded with the part encoders, then the response encoder chain.
  Responder& multipart(MultipartBody body);

  // Encoders local to this response, consulted before the expectation ones.
  Responder& encoders(const EncodersConfigurator& configurator);

  // Encoders local to the parts of the multipart body, consulted before the response ones.
  Responder& partEncoders(const EncodersConfigurator& configurator);

  // Delay before the first byte of the response.
  Responder& delay(DelaySpec delay);

  // Sends the body in 'nbChunks' byte balanced chunks, each followed by 'delay'.
  // Throws std::invalid_argument if 'nbChunks' is 0.
  Responder& chunked(uint32_t nbChunks, DelaySpec delay = {});

  // Trailer sent after the last chunk. Trailers are only sent with chunked responses.
  Responder& trailer(std::string_view name, std::string_view value);

  // Compresses the body with 'encoding' whatever the client accepts, Encoding::none disables compression.
  // Chunked bodies are compressed as a single stream flushed at each chunk.
  // Throws std::invalid_argument if the codec is not compiled in or if 'level' is out of its bounds.
  Responder& compression(Encoding encoding, std::optional<int> level = std::nullopt);

  [[nodiscard]] ResponderKind kind() const noexcept { return static_cast<ResponderKind>(_payload.index()); }

  [[nodiscard]] http::StatusCode statusCode() const noexcept { return _status; }

  [[nodiscard]] const NamedValues& headers() const noexcept { return _headers; }

  [[nodiscard]] const NamedValues& trailers() const noexcept { return _trailers; }

  [[nodiscard]] const std::optional<DelaySpec>& initialDelay() const noexcept { return _delay; }

  [[nodiscard]] const std::optional<ChunkSpec>& chunks() const noexcept { return _chunks; }

  [[nodiscard]] const EncoderRegistry& localEncoders() const noexcept { return _encoders; }

  // Set when compression is imposed by this response rather than negotiated.
  [[nodiscard]] const std::optional<CompressionDirective>& compressionDirective() const noexcept {
    return _compression;
  }

  struct ContentPayload {
    std::string bytes;
    std::any object;
    std::string contentType;
  };

  struct ForwardPayload {
    std::string baseUrl;
  };

  struct MultipartPayload {
    MultipartBody body;
    EncoderRegistry partEncoders;
  };

  [[nodiscard]] const ContentPayload* content() const noexcept { return std::get_if<ContentPayload>(&_payload); }

  [[nodiscard]] const ForwardPayload* forward() const noexcept { return std::get_if<ForwardPayload>(&_payload); }

  [[nodiscard]] const MultipartPayload* multipartPayload() const noexcept {
    return std::get_if<MultipartPayload>(&_payload);
  }

  // Checks that every object of this response can be encoded with 'encoders' (this response local encoders
  // excluded, they are prepended here) and that timings are valid.
  // Throws std::invalid_argument otherwise.
  void validate(const EncoderChain& encoders) const;

 private:
  ContentPayload& contentPayload();

  std::variant<ContentPayload, ForwardPayload, MultipartPayload> _payload;
  NamedValues _headers;
  NamedValues _trailers;
  EncoderRegistry _encoders;
  std::optional<DelaySpec> _delay;
  std::optional<ChunkSpec> _chunks;
  std::optional<CompressionDirective> _compression;
  http::StatusCode _status;
};

}  // namespace decoy
