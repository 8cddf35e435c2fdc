#include "decoy/codec-registry.hpp"

#include <cxxabi.h>
#include <spdlog/fmt/fmt.h>

#include <any>
#include <cstddef>
#include <cstdlib>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <typeindex>
#include <typeinfo>
#include <utility>

#include "decoy/builtin-codecs.hpp"
#include "decoy/http-constants.hpp"
#include "decoy/media-type.hpp"
#include "decoy/vector.hpp"

namespace decoy {

namespace {

template <class Entries, class Matches>
auto FindBest(const Entries& entries, const MediaType& mediaType, Matches&& matches) -> decltype(&*entries.begin()) {
  decltype(&*entries.begin()) best = nullptr;
  auto bestSpecificity = MediaRangeMatch::none;
  for (const auto& entry : entries) {
    if (!matches(entry)) {
      continue;
    }
    const auto specificity = MatchMediaRange(entry.mediaRange, mediaType);
    // '>=' : among equally specific ranges, the latest registration wins
    if (specificity != MediaRangeMatch::none && specificity >= bestSpecificity) {
      best = &entry;
      bestSpecificity = specificity;
    }
  }
  return best;
}

void CheckMediaRange(std::string_view mediaRange) {
  if (!IsValidMediaRange(mediaRange)) {
    throw std::invalid_argument(fmt::format("Invalid media range '{}'", mediaRange));
  }
}

MediaType ParseContentType(std::string_view contentTypeHeader) {
  if (contentTypeHeader.empty()) {
    contentTypeHeader = http::ContentTypeApplicationOctetStream;
  }
  return MediaType::ParseOrThrow(contentTypeHeader);
}

}  // namespace

std::any DecodingContext::decodeNested(std::string_view bytes, std::string_view contentTypeHeader) const {
  if (chain == nullptr) {
    throw std::invalid_argument("No decoder chain available for nested content");
  }
  return chain->decode(bytes, contentTypeHeader, bytes.size());
}

std::string EncodingContext::encodeNested(const std::any& object, std::string_view contentTypeHeader) const {
  if (chain == nullptr) {
    throw std::invalid_argument("No encoder chain available for nested content");
  }
  return chain->encode(object, contentTypeHeader).body;
}

DecoderRegistry& DecoderRegistry::add(std::string_view mediaRange, DecodeFn decodeFn) {
  CheckMediaRange(mediaRange);
  if (!decodeFn) {
    throw std::invalid_argument(fmt::format("Empty decoder registered for '{}'", mediaRange));
  }
  _entries.emplace_back(std::string(mediaRange), std::move(decodeFn));
  return *this;
}

const DecodeFn* DecoderRegistry::find(const MediaType& mediaType) const {
  const auto* entry = FindBest(_entries, mediaType, [](const Entry&) { return true; });
  return entry == nullptr ? nullptr : &entry->decodeFn;
}

EncoderRegistry& EncoderRegistry::add(std::string_view mediaRange, std::type_index objectType, EncodeFn encodeFn) {
  CheckMediaRange(mediaRange);
  if (!encodeFn) {
    throw std::invalid_argument(fmt::format("Empty encoder registered for '{}'", mediaRange));
  }
  _entries.emplace_back(std::string(mediaRange), objectType, std::move(encodeFn));
  return *this;
}

const EncodeFn* EncoderRegistry::find(const MediaType& mediaType, std::type_index objectType) const {
  const auto* entry =
      FindBest(_entries, mediaType, [objectType](const Entry& entry) { return entry.objectType == objectType; });
  return entry == nullptr ? nullptr : &entry->encodeFn;
}

const DecodeFn* DecoderChain::find(const MediaType& mediaType) const {
  for (const DecoderRegistry* registry : _registries) {
    if (const DecodeFn* decodeFn = registry->find(mediaType)) {
      return decodeFn;
    }
  }
  return BuiltinDecoders().find(mediaType);
}

std::any DecoderChain::decode(std::string_view bytes, std::string_view contentTypeHeader,
                              std::optional<std::size_t> declaredLength) const {
  DecodingContext ctx{ParseContentType(contentTypeHeader), {}, declaredLength, this};
  ctx.charset = ctx.contentType.charset();
  const DecodeFn* decodeFn = find(ctx.contentType);
  if (decodeFn == nullptr) {
    throw std::invalid_argument(fmt::format("No decoder for content type '{}'", ctx.contentType.essence()));
  }
  return (*decodeFn)(bytes, ctx);
}

DecoderChain DecoderChain::prepend(const DecoderRegistry& registry) const {
  vector<const DecoderRegistry*> registries;
  registries.reserve(_registries.size() + 1U);
  registries.push_back(&registry);
  registries.insert(registries.end(), _registries.begin(), _registries.end());
  return DecoderChain(std::move(registries));
}

const EncodeFn* EncoderChain::find(const MediaType& mediaType, std::type_index objectType) const {
  for (const EncoderRegistry* registry : _registries) {
    if (const EncodeFn* encodeFn = registry->find(mediaType, objectType)) {
      return encodeFn;
    }
  }
  return BuiltinEncoders().find(mediaType, objectType);
}

bool EncoderChain::canEncode(std::string_view contentTypeHeader, std::type_index objectType) const {
  if (contentTypeHeader.empty()) {
    contentTypeHeader = http::ContentTypeApplicationOctetStream;
  }
  auto mediaType = MediaType::Parse(contentTypeHeader);
  return mediaType && find(*mediaType, objectType) != nullptr;
}

EncoderChain::Encoded EncoderChain::encode(const std::any& object, std::string_view contentTypeHeader) const {
  if (contentTypeHeader.empty()) {
    contentTypeHeader = http::ContentTypeApplicationOctetStream;
  }
  EncodingContext ctx{ParseContentType(contentTypeHeader), {}, std::string(contentTypeHeader), this};
  ctx.charset = ctx.contentType.charset();
  const std::type_index objectType(object.type());
  const EncodeFn* encodeFn = find(ctx.contentType, objectType);
  if (encodeFn == nullptr) {
    throw std::invalid_argument(fmt::format("No encoder for content type '{}' and object type {}",
                                            ctx.contentType.essence(), TypeName(object.type())));
  }
  Encoded ret;
  ret.body = (*encodeFn)(object, ctx);
  ret.contentTypeHeader = std::move(ctx.contentTypeHeader);
  return ret;
}

EncoderChain EncoderChain::prepend(const EncoderRegistry& registry) const {
  vector<const EncoderRegistry*> registries;
  registries.reserve(_registries.size() + 1U);
  registries.push_back(&registry);
  registries.insert(registries.end(), _registries.begin(), _registries.end());
  return EncoderChain(std::move(registries));
}

std::string TypeName(const std::type_info& typeInfo) {
  int status = 0;
  std::unique_ptr<char, void (*)(void*)> demangled(abi::__cxa_demangle(typeInfo.name(), nullptr, nullptr, &status),
                                                    std::free);
  return status == 0 && demangled ? std::string(demangled.get()) : std::string(typeInfo.name());
}

}  // namespace decoy
