#include "decoy/responder.hpp"

#include <spdlog/fmt/fmt.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <typeindex>
#include <utility>
#include <variant>

#include "decoy/ascii.hpp"
#include "decoy/codec-registry.hpp"
#include "decoy/compression-config.hpp"
#include "decoy/encoding.hpp"
#include "decoy/http-status-code.hpp"
#include "decoy/multipart.hpp"

namespace decoy {

DelaySpec DelaySpec::Between(std::chrono::milliseconds min, std::chrono::milliseconds max) {
  DelaySpec ret{min, max};
  ret.validate();
  return ret;
}

void DelaySpec::validate() const {
  if (min.count() < 0) {
    throw std::invalid_argument(fmt::format("Negative delay {}ms", min.count()));
  }
  if (min > max) {
    throw std::invalid_argument(fmt::format("Invalid delay range [{}ms, {}ms]", min.count(), max.count()));
  }
}

Responder Responder::Forward(std::string_view upstreamBaseUrl) {
  if (!StartsWithCaseInsensitive(upstreamBaseUrl, "http://") &&
      !StartsWithCaseInsensitive(upstreamBaseUrl, "https://")) {
    throw std::invalid_argument(fmt::format("Invalid upstream URL '{}', expected http:// or https://", upstreamBaseUrl));
  }
  Responder ret;
  // drop trailing slashes, the original path always starts with one
  while (upstreamBaseUrl.ends_with('/')) {
    upstreamBaseUrl.remove_suffix(1);
  }
  ret._payload = ForwardPayload{std::string(upstreamBaseUrl)};
  return ret;
}

Responder& Responder::status(http::StatusCode status) {
  if (!http::IsValidStatusCode(status)) {
    throw std::invalid_argument(fmt::format("Invalid status code {}", status));
  }
  _status = status;
  return *this;
}

Responder& Responder::header(std::string_view name, std::string_view value) {
  if (name.empty()) {
    throw std::invalid_argument("Response header name cannot be empty");
  }
  _headers.emplace_back(std::string(name), std::string(value));
  return *this;
}

Responder& Responder::body(std::string_view bytes, std::string_view contentType) {
  auto& content = contentPayload();
  content.bytes = bytes;
  content.object.reset();
  content.contentType = contentType;
  return *this;
}

Responder& Responder::multipart(MultipartBody body) {
  if (auto* multipartPayload = std::get_if<MultipartPayload>(&_payload)) {
    multipartPayload->body = std::move(body);
  } else {
    _payload = MultipartPayload{std::move(body), {}};
  }
  return *this;
}

Responder& Responder::encoders(const EncodersConfigurator& configurator) {
  configurator(_encoders);
  return *this;
}

Responder& Responder::partEncoders(const EncodersConfigurator& configurator) {
  auto* multipartPayload = std::get_if<MultipartPayload>(&_payload);
  if (multipartPayload == nullptr) {
    throw std::invalid_argument("Part encoders can only be set on a multipart response");
  }
  configurator(multipartPayload->partEncoders);
  return *this;
}

Responder& Responder::delay(DelaySpec delay) {
  delay.validate();
  _delay = delay;
  return *this;
}

Responder& Responder::chunked(uint32_t nbChunks, DelaySpec delay) {
  if (nbChunks == 0) {
    throw std::invalid_argument("Number of chunks should be at least 1");
  }
  delay.validate();
  _chunks = ChunkSpec{nbChunks, delay};
  return *this;
}

Responder& Responder::trailer(std::string_view name, std::string_view value) {
  if (name.empty()) {
    throw std::invalid_argument("Trailer name cannot be empty");
  }
  _trailers.emplace_back(std::string(name), std::string(value));
  return *this;
}

Responder& Responder::compression(Encoding encoding, std::optional<int> level) {
  CompressionDirective directive{encoding, level};
  directive.validate();
  _compression = directive;
  return *this;
}

Responder::ContentPayload& Responder::contentPayload() {
  if (!std::holds_alternative<ContentPayload>(_payload)) {
    _payload = ContentPayload{};
  }
  return std::get<ContentPayload>(_payload);
}

void Responder::validate(const EncoderChain& encoders) const {
  if (!http::IsValidStatusCode(_status)) {
    throw std::invalid_argument(fmt::format("Invalid status code {}", _status));
  }
  if (_delay) {
    _delay->validate();
  }
  if (_chunks) {
    _chunks->delay.validate();
  }
  if (_compression) {
    _compression->validate();
  }
  const EncoderChain chain = encoders.prepend(_encoders);
  if (const auto* content = std::get_if<ContentPayload>(&_payload)) {
    if (content->object.has_value() && !chain.canEncode(content->contentType, std::type_index(content->object.type()))) {
      throw std::invalid_argument(fmt::format("No encoder for content type '{}' and object type {}",
                                              content->contentType, TypeName(content->object.type())));
    }
  } else if (const auto* multipartPayload = std::get_if<MultipartPayload>(&_payload)) {
    const EncoderChain partChain = chain.prepend(multipartPayload->partEncoders);
    for (const auto& part : multipartPayload->body.parts) {
      if (part.value.has_value() && !partChain.canEncode(part.contentType, std::type_index(part.value.type()))) {
        throw std::invalid_argument(fmt::format("No encoder for part '{}' of content type '{}' and object type {}",
                                                part.name, part.contentType, TypeName(part.value.type())));
      }
    }
  }
}

}  // namespace decoy
