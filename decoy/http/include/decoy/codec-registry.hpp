#pragma once

#include <any>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>

#include "decoy/media-type.hpp"
#include "decoy/vector.hpp"

namespace decoy {

class DecoderChain;
class EncoderChain;

// Context given to a decoder: the parsed content type of the bytes, its charset, the declared length if any,
// and the chain of decoders the decoder was resolved from, to delegate decoding of nested content.
struct DecodingContext {
  MediaType contentType;
  std::string charset;
  std::optional<std::size_t> declaredLength;
  const DecoderChain* chain{nullptr};

  // Decodes nested content through the same chain.
  // Throws std::invalid_argument if no decoder can be resolved for 'contentTypeHeader'.
  [[nodiscard]] std::any decodeNested(std::string_view bytes, std::string_view contentTypeHeader) const;
};

// Context given to an encoder. 'contentTypeHeader' may be rewritten by the encoder (e.g. to add a generated
// multipart boundary); the caller uses it as the final Content-Type header value.
struct EncodingContext {
  MediaType contentType;
  std::string charset;
  std::string contentTypeHeader;
  const EncoderChain* chain{nullptr};

  // Encodes nested content through the same chain. Throws std::invalid_argument if no encoder can be resolved.
  [[nodiscard]] std::string encodeNested(const std::any& object, std::string_view contentTypeHeader) const;
};

using DecodeFn = std::function<std::any(std::string_view, const DecodingContext&)>;
using EncodeFn = std::function<std::string(const std::any&, EncodingContext&)>;

// Decoders keyed by media range ("application/json", "text/*", "*/*").
// Lookup picks the most specific range, and among equally specific ranges the latest registration.
class DecoderRegistry {
 public:
  // Throws std::invalid_argument if 'mediaRange' is not a valid media range or if 'decodeFn' is empty.
  DecoderRegistry& add(std::string_view mediaRange, DecodeFn decodeFn);

  // Registers a typed decoder: 'func' is called as 'T func(std::string_view, const DecodingContext&)'.
  template <class T, class Func>
  DecoderRegistry& add(std::string_view mediaRange, Func&& func) {
    return add(mediaRange, DecodeFn([func = std::forward<Func>(func)](std::string_view bytes,
                                                                      const DecodingContext& ctx) -> std::any {
                 return std::any(static_cast<T>(func(bytes, ctx)));
               }));
  }

  [[nodiscard]] const DecodeFn* find(const MediaType& mediaType) const;

  [[nodiscard]] bool empty() const noexcept { return _entries.empty(); }

  [[nodiscard]] std::size_t size() const noexcept { return _entries.size(); }

  void clear() noexcept { _entries.clear(); }

 private:
  struct Entry {
    std::string mediaRange;
    DecodeFn decodeFn;
  };

  vector<Entry> _entries;
};

// Encoders keyed by (media range, object type).
class EncoderRegistry {
 public:
  // Throws std::invalid_argument if 'mediaRange' is not a valid media range or if 'encodeFn' is empty.
  EncoderRegistry& add(std::string_view mediaRange, std::type_index objectType, EncodeFn encodeFn);

  // Registers a typed encoder: 'func' is called as 'std::string func(const T&, EncodingContext&)'.
  template <class T, class Func>
  EncoderRegistry& add(std::string_view mediaRange, Func&& func) {
    return add(mediaRange, std::type_index(typeid(T)),
               EncodeFn([func = std::forward<Func>(func)](const std::any& object, EncodingContext& ctx) -> std::string {
                 return func(std::any_cast<const T&>(object), ctx);
               }));
  }

  [[nodiscard]] const EncodeFn* find(const MediaType& mediaType, std::type_index objectType) const;

  [[nodiscard]] bool empty() const noexcept { return _entries.empty(); }

  [[nodiscard]] std::size_t size() const noexcept { return _entries.size(); }

  void clear() noexcept { _entries.clear(); }

 private:
  struct Entry {
    std::string mediaRange;
    std::type_index objectType;
    EncodeFn encodeFn;
  };

  vector<Entry> _entries;
};

// Ordered view over decoder registries, closest first (expectation, then group, then server-wide).
// Built-in decoders are always consulted last. The first registry providing a decoder wins.
class DecoderChain {
 public:
  DecoderChain() = default;

  explicit DecoderChain(vector<const DecoderRegistry*> registries) : _registries(std::move(registries)) {}

  [[nodiscard]] const DecodeFn* find(const MediaType& mediaType) const;

  // Decodes 'bytes' according to 'contentTypeHeader' (an empty header is treated as application/octet-stream).
  // Throws std::invalid_argument if the media type is invalid or if no decoder is found,
  // and propagates exceptions thrown by the decoder.
  [[nodiscard]] std::any decode(std::string_view bytes, std::string_view contentTypeHeader,
                                std::optional<std::size_t> declaredLength = std::nullopt) const;

  // Returns a chain with 'registry' consulted before the registries of this chain.
  [[nodiscard]] DecoderChain prepend(const DecoderRegistry& registry) const;

 private:
  vector<const DecoderRegistry*> _registries;
};

// Ordered view over encoder registries, closest first (per-part, response, group, then server-wide).
// Built-in encoders are always consulted last.
class EncoderChain {
 public:
  EncoderChain() = default;

  explicit EncoderChain(vector<const EncoderRegistry*> registries) : _registries(std::move(registries)) {}

  [[nodiscard]] const EncodeFn* find(const MediaType& mediaType, std::type_index objectType) const;

  [[nodiscard]] bool canEncode(std::string_view contentTypeHeader, std::type_index objectType) const;

  struct Encoded {
    std::string body;
    std::string contentTypeHeader;
  };

  // Encodes 'object' as 'contentTypeHeader'.
  // Throws std::invalid_argument if the media type is invalid or if no encoder is found,
  // and propagates exceptions thrown by the encoder.
  [[nodiscard]] Encoded encode(const std::any& object, std::string_view contentTypeHeader) const;

  [[nodiscard]] EncoderChain prepend(const EncoderRegistry& registry) const;

 private:
  vector<const EncoderRegistry*> _registries;
};

// Human readable name of a type held by a std::any, for diagnostics.
[[nodiscard]] std::string TypeName(const std::type_info& typeInfo);

}  // namespace decoy
