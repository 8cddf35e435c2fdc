#include "decoy/response-synthesizer.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <any>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <random>
#include <string>
#include <string_view>
#include <utility>

#include "decoy/accept-encoding-negotiation.hpp"
#include "decoy/ascii.hpp"
#include "decoy/codec-registry.hpp"
#include "decoy/compression-config.hpp"
#include "decoy/compressor.hpp"
#include "decoy/encoding.hpp"
#include "decoy/expectation.hpp"
#include "decoy/http-constants.hpp"
#include "decoy/http-status-code.hpp"
#include "decoy/log.hpp"
#include "decoy/request-view.hpp"
#include "decoy/responder.hpp"
#include "decoy/response-description.hpp"

namespace decoy {

namespace {

constexpr std::string_view kHopByHopHeaders[] = {
    http::Connection, http::KeepAlive, http::TransferEncoding, http::Upgrade,
    http::Host,       http::ProxyConnection, http::TE,         http::Trailer,
};

bool IsHopByHop(std::string_view name) {
  return std::ranges::any_of(kHopByHopHeaders, [name](std::string_view hop) { return CaseInsensitiveEqual(name, hop); });
}

void SetHeaderIfAbsent(ResponseDescription& response, std::string_view name, std::string_view value) {
  if (!response.headerValue(name)) {
    response.headers.emplace_back(std::string(name), std::string(value));
  }
}

}  // namespace

ResponseSynthesizer::ResponseSynthesizer(CompressionConfig compressionConfig)
    : _compressionConfig(std::move(compressionConfig)), _encodingSelector(_compressionConfig) {}

ResponseDescription ResponseSynthesizer::synthesize(const Expectation& expectation, uint64_t callIndex,
                                                    const RequestView& request) const {
  const Responder* responder = expectation.responderFor(callIndex);
  if (responder == nullptr) {
    return ResponseDescription{};
  }
  if (const auto* forward = responder->forward()) {
    return Forward(*forward, request);
  }

  ResponseDescription response;
  response.status = responder->statusCode();
  response.headers = responder->headers();
  try {
    buildContent(expectation, *responder, response);
  } catch (const std::exception& ex) {
    log::error("Unable to build response {} of expectation {}: {}", callIndex, expectation.index(), ex.what());
    return NoMatch(http::StatusCodeInternalServerError,
                   fmt::format("Unable to build the response of expectation {}: {}", expectation.index(), ex.what()),
                   http::ContentTypeTextPlain);
  }

  negotiateCompression(*responder, request, response);
  BuildStreamPlan(*responder, response);
  return response;
}

void ResponseSynthesizer::buildContent(const Expectation& expectation, const Responder& responder,
                                       ResponseDescription& response) const {
  const EncoderChain responseEncoders = expectation.encoderChain().prepend(responder.localEncoders());
  std::string contentType;
  if (const auto* content = responder.content()) {
    if (content->object.has_value()) {
      auto encoded = responseEncoders.encode(content->object, content->contentType);
      response.body = std::move(encoded.body);
      contentType = std::move(encoded.contentTypeHeader);
    } else {
      response.body = content->bytes;
      contentType = content->contentType;
    }
  } else if (const auto* multipart = responder.multipartPayload()) {
    const EncoderChain partEncoders = responseEncoders.prepend(multipart->partEncoders);
    std::string multipartContentType = fmt::format("multipart/{}", multipart->body.subtype);
    if (!multipart->body.boundary.empty()) {
      multipartContentType = multipart->body.contentTypeHeader();
    }
    auto encoded = partEncoders.encode(std::any(multipart->body), multipartContentType);
    response.body = std::move(encoded.body);
    contentType = std::move(encoded.contentTypeHeader);
  }
  if (!response.body.empty() && !contentType.empty()) {
    SetHeaderIfAbsent(response, http::ContentType, contentType);
  }
}

void ResponseSynthesizer::negotiateCompression(const Responder& responder, const RequestView& request,
                                               ResponseDescription& response) const {
  if (response.body.empty() || response.headerValue(http::ContentEncoding)) {
    // never compress twice a body already encoded by its responder
    return;
  }
  if (const auto& imposed = responder.compressionDirective()) {
    response.compression = *imposed;
    return;
  }
  if (response.body.size() < _compressionConfig.minBytes) {
    return;
  }
  const auto [encoding, reject] = _encodingSelector.negotiateAcceptEncoding(request.headerValueOrEmpty(http::AcceptEncoding));
  // If the client explicitly forbids identity (identity;q=0) and we have no acceptable
  // alternative encodings to offer, emit a 406 per RFC 9110 Section 12.5.3 guidance.
  if (reject) {
    response = NoMatch(http::StatusCodeNotAcceptable, "No acceptable content-coding available",
                       http::ContentTypeTextPlain);
    return;
  }
  if (encoding == Encoding::none) {
    return;
  }
  if (!_compressionConfig.contentTypeAllowList.empty()) {
    const std::string_view contentType = response.headerValueOrEmpty(http::ContentType);
    if (std::ranges::none_of(_compressionConfig.contentTypeAllowList, [contentType](const std::string& allowed) {
          return StartsWithCaseInsensitive(contentType, allowed);
        })) {
      return;
    }
  }
  response.compression = _compressionConfig.directiveFor(encoding);
}

void ResponseSynthesizer::BuildStreamPlan(const Responder& responder, ResponseDescription& response) {
  const auto& chunks = responder.chunks();
  const auto& initialDelay = responder.initialDelay();
  if (!chunks && !initialDelay) {
    return;
  }
  StreamPlan plan;
  if (initialDelay) {
    plan.initialDelay = DrawDelay(*initialDelay);
  }
  const uint32_t nbChunks = chunks ? chunks->nbChunks : 1U;
  for (auto& data : SplitBalanced(response.body, nbChunks)) {
    auto& chunk = plan.chunks.emplace_back();
    chunk.data = std::move(data);
    if (chunks) {
      chunk.delayAfter = DrawDelay(chunks->delay);
    }
  }
  response.body.clear();
  response.streamPlan = std::move(plan);
  response.trailers = responder.trailers();
  SetHeaderIfAbsent(response, http::TransferEncoding, http::chunked);
}

ResponseDescription ResponseSynthesizer::Forward(const Responder::ForwardPayload& forward, const RequestView& request) {
  ResponseDescription response;
  ForwardDirective directive;
  directive.url = forward.baseUrl;
  directive.url.append(request.target());
  directive.method = request.method();
  for (const auto& header : request.headers()) {
    if (!IsHopByHop(header.name)) {
      directive.headers.push_back(header);
    }
  }
  directive.body = request.body();
  response.forward = std::move(directive);
  return response;
}

ResponseDescription ResponseSynthesizer::NoMatch(http::StatusCode status, std::string_view body,
                                                 std::string_view contentType) {
  ResponseDescription response;
  response.status = status;
  response.body = body;
  if (!body.empty()) {
    response.headers.emplace_back(std::string(http::ContentType), std::string(contentType));
  }
  return response;
}

vector<std::string> ResponseSynthesizer::SplitBalanced(std::string_view body, uint32_t nbChunks) {
  vector<std::string> ret;
  const std::size_t nbParts = std::clamp<std::size_t>(nbChunks, 1U, std::max<std::size_t>(body.size(), 1U));
  ret.reserve(nbParts);
  const std::size_t baseSize = body.size() / nbParts;
  const std::size_t nbLarger = body.size() % nbParts;
  for (std::size_t part = 0; part < nbParts; ++part) {
    const std::size_t size = baseSize + (part < nbLarger ? 1U : 0U);
    ret.emplace_back(body.substr(0, size));
    body.remove_prefix(size);
  }
  return ret;
}

std::chrono::milliseconds ResponseSynthesizer::DrawDelay(const DelaySpec& delay) {
  if (delay.min >= delay.max) {
    return delay.min;
  }
  thread_local std::mt19937_64 rng{std::random_device{}()};
  std::uniform_int_distribution<std::chrono::milliseconds::rep> dist(delay.min.count(), delay.max.count());
  return std::chrono::milliseconds(dist(rng));
}

void ApplyCompression(ResponseDescription& response, const CompressionConfig& compressionConfig) {
  if (response.compression.encoding == Encoding::none || response.forward) {
    return;
  }
  const Encoding encoding = response.compression.encoding;
  auto compressor = MakeCompressor(response.compression);
  response.compression = {};
  if (!compressor) {
    log::warn("Encoding {} is not available, response sent uncompressed", EncodingToken(encoding));
    return;
  }
  if (response.streamPlan && !response.streamPlan->chunks.empty()) {
    auto& chunks = response.streamPlan->chunks;
    for (std::size_t pos = 0; pos < chunks.size(); ++pos) {
      std::string compressed;
      compressor->feed(chunks[pos].data, pos + 1 == chunks.size(), compressed);
      chunks[pos].data = std::move(compressed);
    }
  } else {
    std::string compressed;
    compressor->feed(response.body, true, compressed);
    response.body = std::move(compressed);
  }
  response.headers.emplace_back(std::string(http::ContentEncoding), std::string(EncodingToken(encoding)));
  if (compressionConfig.addVaryHeader) {
    auto vary = std::ranges::find_if(response.headers, [](const NamedValue& header) {
      return CaseInsensitiveEqual(header.name, http::Vary);
    });
    if (vary == response.headers.end()) {
      response.headers.emplace_back(std::string(http::Vary), std::string(http::AcceptEncoding));
    } else if (!CaseInsensitiveEqual(vary->value, http::AcceptEncoding) && vary->value != "*") {
      vary->value.append(", ").append(http::AcceptEncoding);
    }
  }
}

}  // namespace decoy
