#include "decoy/matcher.hpp"

#include <spdlog/fmt/fmt.h>

#include <any>
#include <cstddef>
#include <exception>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <variant>

#include "decoy/codec-registry.hpp"
#include "decoy/encoding.hpp"
#include "decoy/http-constants.hpp"
#include "decoy/http-method.hpp"
#include "decoy/log.hpp"
#include "decoy/request-view.hpp"
#include "decoy/string-trim.hpp"
#include "decoy/value-matcher.hpp"
#ifdef DECOY_ENABLE_ZLIB
#include "decoy/zlib-codec.hpp"
#endif

namespace decoy {

std::string_view MatcherKindStr(MatcherKind kind) noexcept {
  switch (kind) {
    case MatcherKind::method:
      return "method";
    case MatcherKind::path:
      return "path";
    case MatcherKind::query:
      return "query";
    case MatcherKind::header:
      return "header";
    case MatcherKind::cookie:
      return "cookie";
    case MatcherKind::body:
      return "body";
    case MatcherKind::secure:
      return "secure";
    default:
      return "unknown";
  }
}

namespace {

std::string_view FacetPluralStr(MatcherKind kind) noexcept {
  return kind == MatcherKind::cookie ? std::string_view("cookies") : std::string_view("headers");
}

}  // namespace

std::string_view MatchContext::contentDecodedBody() {
  if (!_contentDecoded) {
    _contentDecoded = true;
    std::string_view contentEncoding = TrimOws(_request.headerValueOrEmpty(http::ContentEncoding));
    // codings are listed in the order they were applied, undo them from the last one
    [[maybe_unused]] std::string_view current = _request.body();
    while (!contentEncoding.empty()) {
      const auto lastComma = contentEncoding.rfind(',');
      const std::string_view token =
          TrimOws(lastComma == std::string_view::npos ? contentEncoding : contentEncoding.substr(lastComma + 1));
      contentEncoding = lastComma == std::string_view::npos ? std::string_view{}
                                                            : TrimOws(contentEncoding.substr(0, lastComma));
      const auto encoding = EncodingFromToken(token);
      if (!encoding) {
        _contentDecodingFailure = fmt::format("unknown content encoding '{}'", token);
        break;
      }
      if (*encoding == Encoding::none) {
        continue;
      }
      if (*encoding != Encoding::gzip && *encoding != Encoding::deflate) {
        _contentDecodingFailure = fmt::format("unsupported request content encoding '{}'", token);
        break;
      }
#ifdef DECOY_ENABLE_ZLIB
      std::string inflated;
      if (!ZlibInflate(current, *encoding == Encoding::gzip, _maxDecompressedBytes, inflated)) {
        _contentDecodingFailure = fmt::format("invalid {} body", token);
        break;
      }
      _inflatedBody = std::move(inflated);
      current = *_inflatedBody;
#else
      _contentDecodingFailure = fmt::format("request content encoding '{}' is not enabled in this build", token);
      break;
#endif
    }
  }
  if (!_contentDecodingFailure.empty()) {
    throw std::invalid_argument(_contentDecodingFailure);
  }
  return _inflatedBody ? std::string_view(*_inflatedBody) : _request.body();
}

const std::any& MatchContext::decodedBody(const DecoderChain& chain) {
  std::string_view contentTypeHeader = _request.contentType();
  if (contentTypeHeader.empty()) {
    contentTypeHeader = http::ContentTypeApplicationOctetStream;
  }
  const MediaType mediaType = MediaType::ParseOrThrow(contentTypeHeader);
  const DecodeFn* decodeFn = chain.find(mediaType);
  if (decodeFn == nullptr) {
    throw std::invalid_argument(fmt::format("no decoder for content type '{}'", mediaType.essence()));
  }
  for (const auto& entry : _decodedBodies) {
    if (entry.decodeFn == decodeFn && entry.chain == &chain) {
      if (!entry.failure.empty()) {
        throw std::invalid_argument(entry.failure);
      }
      return entry.object;
    }
  }
  auto& entry = _decodedBodies.emplace_back(decodeFn, &chain, std::any{}, std::string{});
  try {
    const std::string_view bytes = contentDecodedBody();
    DecodingContext decodingCtx{mediaType, mediaType.charset(), bytes.size(), &chain};
    entry.object = (*decodeFn)(bytes, decodingCtx);
  } catch (const std::exception& ex) {
    entry.failure = ex.what();
    throw;
  }
  return entry.object;
}

bool GlobMatch(std::string_view pattern, std::string_view path) {
  while (!pattern.empty()) {
    if (pattern.starts_with("**")) {
      pattern.remove_prefix(2);
      for (std::size_t pos = 0; pos <= path.size(); ++pos) {
        if (GlobMatch(pattern, path.substr(pos))) {
          return true;
        }
      }
      return false;
    }
    if (pattern.front() == '*') {
      pattern.remove_prefix(1);
      for (std::size_t pos = 0;; ++pos) {
        if (GlobMatch(pattern, path.substr(pos))) {
          return true;
        }
        if (pos == path.size() || path[pos] == '/') {
          return false;
        }
      }
    }
    if (path.empty()) {
      return false;
    }
    if (pattern.front() == '?') {
      if (path.front() == '/') {
        return false;
      }
    } else if (pattern.front() != path.front()) {
      return false;
    }
    pattern.remove_prefix(1);
    path.remove_prefix(1);
  }
  return path.empty();
}

Matcher Matcher::Method(http::Method method) {
  return {MatcherKind::method, MethodEquals{std::string(http::MethodToStr(method))}};
}

Matcher Matcher::Method(std::string_view method) {
  if (method.empty()) {
    throw std::invalid_argument("Method matcher requires a non empty method");
  }
  return {MatcherKind::method, MethodEquals{std::string(method)}};
}

Matcher Matcher::Path(std::string_view path) { return {MatcherKind::path, PathEquals{std::string(path)}}; }

Matcher Matcher::PathGlob(std::string_view pattern) {
  if (pattern.empty()) {
    throw std::invalid_argument("Path glob pattern cannot be empty");
  }
  return {MatcherKind::path, PathPattern{std::string(pattern)}};
}

Matcher Matcher::PathSatisfies(PathPredicate predicate, std::string_view description) {
  if (!predicate) {
    throw std::invalid_argument("Path matcher requires a predicate");
  }
  return {MatcherKind::path, PathPredicateSpec{std::move(predicate), std::string(description)}};
}

Matcher Matcher::Query(std::string_view name, ValueMatcher valueMatcher) {
  if (name.empty()) {
    throw std::invalid_argument("Query matcher requires a parameter name");
  }
  return {MatcherKind::query, NamedValueSpec{std::string(name), std::move(valueMatcher)}};
}

Matcher Matcher::Query(EntriesMatcher entriesMatcher) { return {MatcherKind::query, std::move(entriesMatcher)}; }

Matcher Matcher::Header(std::string_view name, ValueMatcher valueMatcher) {
  if (name.empty()) {
    throw std::invalid_argument("Header matcher requires a header name");
  }
  return {MatcherKind::header, NamedValueSpec{std::string(name), std::move(valueMatcher)}};
}

Matcher Matcher::Header(EntriesMatcher entriesMatcher) { return {MatcherKind::header, std::move(entriesMatcher)}; }

Matcher Matcher::Cookie(std::string_view name, ValueMatcher valueMatcher) {
  if (name.empty()) {
    throw std::invalid_argument("Cookie matcher requires a cookie name");
  }
  return {MatcherKind::cookie, NamedValueSpec{std::string(name), std::move(valueMatcher)}};
}

Matcher Matcher::Cookie(EntriesMatcher entriesMatcher) { return {MatcherKind::cookie, std::move(entriesMatcher)}; }

Matcher Matcher::NoCookies() { return Cookie(EntriesMatcher::Empty()); }

Matcher Matcher::Body(ValueMatcher valueMatcher) { return {MatcherKind::body, std::move(valueMatcher)}; }

Matcher Matcher::BodyObject(BodyPredicate predicate, std::string_view description) {
  if (!predicate) {
    throw std::invalid_argument("Body matcher requires a predicate");
  }
  return {MatcherKind::body, BodyObjectSpec{std::move(predicate), std::string(description)}};
}

Matcher Matcher::Secure(bool secure) { return {MatcherKind::secure, SecureEquals{secure}}; }

void Matcher::ThrowUnexpectedBodyType(const std::type_info& actual, const std::type_info& expected) {
  throw std::invalid_argument(
      fmt::format("decoded body is a {}, expected a {}", TypeName(actual), TypeName(expected)));
}

const NamedValues& Matcher::facetEntries(const RequestView& request) const noexcept {
  switch (_kind) {
    case MatcherKind::query:
      return request.queryParams();
    case MatcherKind::cookie:
      return request.cookies();
    default:
      return request.headers();
  }
}

std::string Matcher::describe() const {
  return std::visit(
      [this](const auto& data) -> std::string {
        using T = std::decay_t<decltype(data)>;
        if constexpr (std::is_same_v<T, MethodEquals>) {
          return fmt::format("method is {}", data.method);
        } else if constexpr (std::is_same_v<T, PathEquals>) {
          return fmt::format("path is \"{}\"", data.path);
        } else if constexpr (std::is_same_v<T, PathPattern>) {
          return fmt::format("path matches \"{}\"", data.pattern);
        } else if constexpr (std::is_same_v<T, PathPredicateSpec>) {
          return fmt::format("path satisfies {}", data.description);
        } else if constexpr (std::is_same_v<T, NamedValueSpec>) {
          return fmt::format("{} '{}' {}", _kind == MatcherKind::query ? "query param" : MatcherKindStr(_kind),
                             data.name, data.valueMatcher.describe());
        } else if constexpr (std::is_same_v<T, EntriesMatcher>) {
          if (_kind == MatcherKind::cookie && data.kind() == EntriesMatcher::Kind::empty) {
            return "no cookies";
          }
          return fmt::format("{} {}", _kind == MatcherKind::query ? "query params" : FacetPluralStr(_kind),
                             data.describe());
        } else if constexpr (std::is_same_v<T, ValueMatcher>) {
          return fmt::format("body {}", data.describe());
        } else if constexpr (std::is_same_v<T, BodyObjectSpec>) {
          return fmt::format("body satisfies {}", data.description);
        } else {
          return data.secure ? "request is secure" : "request is not secure";
        }
      },
      _data);
}

bool Matcher::test(MatchContext& ctx, const DecoderChain& decoders) const {
  const RequestView& request = ctx.request();
  return std::visit(
      [&](const auto& data) -> bool {
        using T = std::decay_t<decltype(data)>;
        if constexpr (std::is_same_v<T, MethodEquals>) {
          return request.method() == data.method;
        } else if constexpr (std::is_same_v<T, PathEquals>) {
          return request.path() == data.path;
        } else if constexpr (std::is_same_v<T, PathPattern>) {
          return GlobMatch(data.pattern, request.path());
        } else if constexpr (std::is_same_v<T, PathPredicateSpec>) {
          return data.predicate(request.path());
        } else if constexpr (std::is_same_v<T, NamedValueSpec>) {
          const bool caseInsensitive = _kind == MatcherKind::header;
          const auto values = FindAllValues(facetEntries(request), data.name, caseInsensitive);
          return data.valueMatcher.test(std::span<const std::string_view>(values.data(), values.size()));
        } else if constexpr (std::is_same_v<T, EntriesMatcher>) {
          return data.test(facetEntries(request), _kind == MatcherKind::header);
        } else if constexpr (std::is_same_v<T, ValueMatcher>) {
          if (request.body().empty()) {
            return data.test(std::optional<std::string_view>{});
          }
          return data.test(std::optional<std::string_view>(ctx.contentDecodedBody()));
        } else if constexpr (std::is_same_v<T, BodyObjectSpec>) {
          return data.predicate(ctx.decodedBody(decoders));
        } else {
          return request.secure() == data.secure;
        }
      },
      _data);
}

MatcherOutcome Matcher::evaluate(MatchContext& ctx, const DecoderChain& decoders) const {
  MatcherOutcome outcome{_kind, describe(), false};
  try {
    outcome.passed = test(ctx, decoders);
  } catch (const std::exception& ex) {
    log::debug("Matcher '{}' failed: {}", outcome.description, ex.what());
    outcome.description.append(" (failed: ").append(ex.what()).push_back(')');
  } catch (...) {
    log::debug("Matcher '{}' failed with an unknown exception", outcome.description);
    outcome.description.append(" (failed: unknown exception)");
  }
  return outcome;
}

bool Matcher::matches(MatchContext& ctx, const DecoderChain& decoders) const noexcept {
  try {
    return test(ctx, decoders);
  } catch (const std::exception& ex) {
    log::debug("Matcher of kind {} failed: {}", MatcherKindStr(_kind), ex.what());
  } catch (...) {
    log::debug("Matcher of kind {} failed with an unknown exception", MatcherKindStr(_kind));
  }
  return false;
}

}  // namespace decoy
