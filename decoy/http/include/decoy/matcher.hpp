#pragma once

#include <any>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <typeinfo>
#include <utility>
#include <variant>

#include "decoy/codec-registry.hpp"
#include "decoy/http-method.hpp"
#include "decoy/request-view.hpp"
#include "decoy/value-matcher.hpp"
#include "decoy/vector.hpp"

namespace decoy {

enum class MatcherKind : uint8_t { method, path, query, header, cookie, body, secure };

[[nodiscard]] std::string_view MatcherKindStr(MatcherKind kind) noexcept;

// Result of the evaluation of one matcher against one request.
struct MatcherOutcome {
  MatcherKind kind;
  std::string description;
  bool passed;

  bool operator==(const MatcherOutcome&) const noexcept = default;
};

// Per-request evaluation state shared by all matchers evaluated for this request.
// It caches the content-decoded body and the decoded body objects, so that it is not decoded once per matcher.
// A MatchContext is used by a single thread.
class MatchContext {
 public:
  // 'maxDecompressedBytes' bounds the inflated size of a compressed request body (0 means unlimited).
  explicit MatchContext(const RequestView& request, std::size_t maxDecompressedBytes = 0)
      : _request(request), _maxDecompressedBytes(maxDecompressedBytes) {}

  [[nodiscard]] const RequestView& request() const noexcept { return _request; }

  // Body bytes after removal of its Content-Encoding (gzip, deflate, identity).
  // Throws std::invalid_argument if the body cannot be inflated or if its encoding is not supported.
  [[nodiscard]] std::string_view contentDecodedBody();

  // Body decoded with the decoder resolved from 'chain' for the Content-Type of the request.
  // Throws std::invalid_argument if no decoder exists, and the decoder exception if decoding fails.
  [[nodiscard]] const std::any& decodedBody(const DecoderChain& chain);

 private:
  // The decoded object depends on the chain too, as nested parts are decoded through it.
  struct DecodedEntry {
    const DecodeFn* decodeFn;
    const DecoderChain* chain;
    std::any object;
    std::string failure;
  };

  const RequestView& _request;
  std::size_t _maxDecompressedBytes;
  std::optional<std::string> _inflatedBody;
  std::string _contentDecodingFailure;
  bool _contentDecoded{false};
  vector<DecodedEntry> _decodedBodies;
};

// Glob over a decoded path: '*' matches any sequence of characters within a segment, '**' any sequence of
// characters across segments, '?' exactly one character other than '/'.
[[nodiscard]] bool GlobMatch(std::string_view pattern, std::string_view path);

// Predicate over one facet of a request.
// Matchers are immutable once built and can be evaluated concurrently by several threads.
class Matcher {
 public:
  using PathPredicate = std::function<bool(std::string_view)>;
  using BodyPredicate = std::function<bool(const std::any&)>;

  [[nodiscard]] static Matcher Method(http::Method method);

  // Custom method token, compared case-sensitively. Throws std::invalid_argument if empty.
  [[nodiscard]] static Matcher Method(std::string_view method);

  // Exact comparison with the decoded path.
  [[nodiscard]] static Matcher Path(std::string_view path);

  // Throws std::invalid_argument if 'pattern' is empty.
  [[nodiscard]] static Matcher PathGlob(std::string_view pattern);

  [[nodiscard]] static Matcher PathSatisfies(PathPredicate predicate, std::string_view description);

  [[nodiscard]] static Matcher Query(std::string_view name, ValueMatcher valueMatcher);

  [[nodiscard]] static Matcher Query(EntriesMatcher entriesMatcher);

  // Header names are compared case-insensitively.
  [[nodiscard]] static Matcher Header(std::string_view name, ValueMatcher valueMatcher);

  [[nodiscard]] static Matcher Header(EntriesMatcher entriesMatcher);

  [[nodiscard]] static Matcher Cookie(std::string_view name, ValueMatcher valueMatcher);

  [[nodiscard]] static Matcher Cookie(EntriesMatcher entriesMatcher);

  [[nodiscard]] static Matcher NoCookies();

  // Tests the body bytes (content-decoded) as a single value.
  [[nodiscard]] static Matcher Body(ValueMatcher valueMatcher);

  // Tests the body decoded by the decoder resolved for its Content-Type.
  [[nodiscard]] static Matcher BodyObject(BodyPredicate predicate, std::string_view description);

  // Typed version of BodyObject: the decoded body must be a T, 'pred' is called as 'bool pred(const T&)'.
  template <class T, class Pred>
  [[nodiscard]] static Matcher BodyAs(Pred pred, std::string_view description) {
    return BodyObject(
        [pred = std::move(pred)](const std::any& object) -> bool {
          const T* typed = std::any_cast<T>(&object);
          if (typed == nullptr) {
            ThrowUnexpectedBodyType(object.type(), typeid(T));
          }
          return static_cast<bool>(pred(*typed));
        },
        description);
  }

  // Passes if whether the request arrived through the encrypted listener equals 'secure'.
  [[nodiscard]] static Matcher Secure(bool secure = true);

  [[nodiscard]] MatcherKind kind() const noexcept { return _kind; }

  [[nodiscard]] std::string describe() const;

  // Evaluates this matcher. Never throws: an exception raised by a predicate or a decoder is reported as a failed
  // outcome whose description holds the exception message.
  [[nodiscard]] MatcherOutcome evaluate(MatchContext& ctx, const DecoderChain& decoders) const;

  // Same result as evaluate(ctx, decoders).passed, without building the description.
  [[nodiscard]] bool matches(MatchContext& ctx, const DecoderChain& decoders) const noexcept;

 private:
  struct MethodEquals {
    std::string method;
  };
  struct PathEquals {
    std::string path;
  };
  struct PathPattern {
    std::string pattern;
  };
  struct PathPredicateSpec {
    PathPredicate predicate;
    std::string description;
  };
  struct NamedValueSpec {
    std::string name;
    ValueMatcher valueMatcher;
  };
  struct BodyObjectSpec {
    BodyPredicate predicate;
    std::string description;
  };
  struct SecureEquals {
    bool secure;
  };

  using Data = std::variant<MethodEquals, PathEquals, PathPattern, PathPredicateSpec, NamedValueSpec, EntriesMatcher,
                            ValueMatcher, BodyObjectSpec, SecureEquals>;

  Matcher(MatcherKind kind, Data data) : _data(std::move(data)), _kind(kind) {}

  [[noreturn]] static void ThrowUnexpectedBodyType(const std::type_info& actual, const std::type_info& expected);

  [[nodiscard]] bool test(MatchContext& ctx, const DecoderChain& decoders) const;

  [[nodiscard]] const NamedValues& facetEntries(const RequestView& request) const noexcept;

  Data _data;
  MatcherKind _kind;
};

}  // namespace decoy
