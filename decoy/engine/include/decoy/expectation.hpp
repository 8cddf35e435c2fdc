#pragma once

#include <any>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "decoy/call-count.hpp"
#include "decoy/call-counter.hpp"
#include "decoy/codec-registry.hpp"
#include "decoy/http-method.hpp"
#include "decoy/matcher.hpp"
#include "decoy/responder.hpp"
#include "decoy/value-matcher.hpp"
#include "decoy/vector.hpp"

namespace decoy {

// Fluent setters of request matchers shared by expectations and requirements.
// Method and path matchers are kept apart from the other ones: they are evaluated first as they fail fast.
template <class Derived>
class MatcherSetBuilder {
 public:
  Derived& method(http::Method method) { return setMethod(Matcher::Method(method)); }

  Derived& method(std::string_view method) { return setMethod(Matcher::Method(method)); }

  Derived& path(std::string_view path) { return setPath(Matcher::Path(path)); }

  Derived& pathGlob(std::string_view pattern) { return setPath(Matcher::PathGlob(pattern)); }

  Derived& pathSatisfies(Matcher::PathPredicate predicate, std::string_view description) {
    return setPath(Matcher::PathSatisfies(std::move(predicate), description));
  }

  Derived& query(std::string_view name, ValueMatcher valueMatcher) {
    return matcher(Matcher::Query(name, std::move(valueMatcher)));
  }

  Derived& query(std::string_view name, std::string_view value) { return query(name, ValueMatcher::Equals(value)); }

  Derived& queryParams(EntriesMatcher entriesMatcher) { return matcher(Matcher::Query(std::move(entriesMatcher))); }

  Derived& header(std::string_view name, ValueMatcher valueMatcher) {
    return matcher(Matcher::Header(name, std::move(valueMatcher)));
  }

  Derived& header(std::string_view name, std::string_view value) { return header(name, ValueMatcher::Equals(value)); }

  Derived& headers(EntriesMatcher entriesMatcher) { return matcher(Matcher::Header(std::move(entriesMatcher))); }

  Derived& cookie(std::string_view name, ValueMatcher valueMatcher) {
    return matcher(Matcher::Cookie(name, std::move(valueMatcher)));
  }

  Derived& cookie(std::string_view name, std::string_view value) { return cookie(name, ValueMatcher::Equals(value)); }

  Derived& cookies(EntriesMatcher entriesMatcher) { return matcher(Matcher::Cookie(std::move(entriesMatcher))); }

  Derived& noCookies() { return matcher(Matcher::NoCookies()); }

  Derived& body(ValueMatcher valueMatcher) { return matcher(Matcher::Body(std::move(valueMatcher))); }

  Derived& body(std::string_view bytes) { return body(ValueMatcher::Equals(bytes)); }

  Derived& bodyObject(Matcher::BodyPredicate predicate, std::string_view description) {
    return matcher(Matcher::BodyObject(std::move(predicate), description));
  }

  template <class T, class Pred>
  Derived& bodyAs(Pred pred, std::string_view description) {
    return matcher(Matcher::BodyAs<T>(std::move(pred), description));
  }

  Derived& secure(bool secure = true) { return matcher(Matcher::Secure(secure)); }

  // Appends any matcher. Method and path matchers replace the previous ones.
  Derived& matcher(Matcher matcher) {
    switch (matcher.kind()) {
      case MatcherKind::method:
        return setMethod(std::move(matcher));
      case MatcherKind::path:
        return setPath(std::move(matcher));
      default:
        _matchers.push_back(std::move(matcher));
        return static_cast<Derived&>(*this);
    }
  }

  [[nodiscard]] const std::optional<Matcher>& methodMatcher() const noexcept { return _methodMatcher; }

  [[nodiscard]] const std::optional<Matcher>& pathMatcher() const noexcept { return _pathMatcher; }

  // Matchers other than method and path, in registration order.
  [[nodiscard]] const vector<Matcher>& otherMatchers() const noexcept { return _matchers; }

  // Number of matchers in total.
  [[nodiscard]] std::size_t nbMatchers() const noexcept {
    return _matchers.size() + (_methodMatcher ? 1U : 0U) + (_pathMatcher ? 1U : 0U);
  }

  // Calls 'func' for each matcher in evaluation order: method, path, then the other ones.
  // Stops as soon as 'func' returns false. Returns false if stopped.
  template <class Func>
  bool forEachMatcher(Func&& func) const {
    if (_methodMatcher && !func(*_methodMatcher)) {
      return false;
    }
    if (_pathMatcher && !func(*_pathMatcher)) {
      return false;
    }
    for (const Matcher& matcher : _matchers) {
      if (!func(matcher)) {
        return false;
      }
    }
    return true;
  }

 protected:
  MatcherSetBuilder() = default;

 private:
  Derived& setMethod(Matcher matcher) {
    _methodMatcher = std::move(matcher);
    return static_cast<Derived&>(*this);
  }

  Derived& setPath(Matcher matcher) {
    _pathMatcher = std::move(matcher);
    return static_cast<Derived&>(*this);
  }

  std::optional<Matcher> _methodMatcher;
  std::optional<Matcher> _pathMatcher;
  vector<Matcher> _matchers;
};

// Codecs shared by the expectations registered in the same expectations() block.
struct CodecGroup {
  DecoderRegistry decoders;
  EncoderRegistry encoders;
};

// Cross-cutting constraint: its matchers are ANDed into the ones of every expectation it applies to.
// Its method and path matchers, if any, define the scope of the requirement (which requests it applies to) instead
// of being requirements themselves.
class Requirement : public MatcherSetBuilder<Requirement> {
 public:
  Requirement() = default;

  // Whether this requirement applies to 'ctx.request()', judged on its method and path only.
  [[nodiscard]] bool appliesTo(MatchContext& ctx) const;

  [[nodiscard]] std::string describeScope() const;

  // Calls 'func' for each constraint of this requirement (its matchers other than the scope ones), in registration
  // order. Stops as soon as 'func' returns false. Returns false if stopped.
  template <class Func>
  bool forEachConstraint(Func&& func) const {
    for (const Matcher& matcher : otherMatchers()) {
      if (!func(matcher)) {
        return false;
      }
    }
    return true;
  }
};

// A request matcher paired with the responses to send and the number of calls it is expected to receive.
// Once registered in a server, an expectation is immutable except for its call counter.
class Expectation : public MatcherSetBuilder<Expectation> {
 public:
  using DecodersConfigurator = std::function<void(DecoderRegistry&)>;
  using EncodersConfigurator = std::function<void(EncoderRegistry&)>;

  Expectation() = default;

  Expectation(const Expectation&) = delete;
  Expectation(Expectation&&) = delete;
  Expectation& operator=(const Expectation&) = delete;
  Expectation& operator=(Expectation&&) = delete;

  ~Expectation() = default;

  // Appends a responder. The Nth matching call is answered by the Nth responder, the last one being reused once
  // all of them have been used. Without responder, a 200 with an empty body is sent.
  Expectation& respond(Responder responder);

  Expectation& times(CallCount callCount);

  // Decoders local to this expectation, consulted before the group and server ones.
  Expectation& decoders(const DecodersConfigurator& configurator);

  // Encoders local to this expectation, consulted before the group and server ones.
  Expectation& encoders(const EncodersConfigurator& configurator);

  // Free text shown in reports.
  Expectation& description(std::string_view description);

  [[nodiscard]] const vector<Responder>& responders() const noexcept { return _responders; }

  // Responder answering the call of index 'callIndex' (1-based), or nullptr if there is no responder.
  [[nodiscard]] const Responder* responderFor(uint64_t callIndex) const noexcept;

  [[nodiscard]] const CallCount& callCount() const noexcept { return _callCount; }

  [[nodiscard]] uint64_t nbCalls() const noexcept { return _counter.value(); }

  // Counts one call and returns its 1-based index.
  uint64_t recordCall() const { return _counter.increment(); }

  // 1-based registration index in its server, 0 if not registered.
  [[nodiscard]] std::size_t index() const noexcept { return _index; }

  [[nodiscard]] std::string describe() const;

  // Codec chains resolved when the expectation is committed: local, group, then server wide registries.
  [[nodiscard]] const DecoderChain& decoderChain() const noexcept { return _decoderChain; }

  [[nodiscard]] const EncoderChain& encoderChain() const noexcept { return _encoderChain; }

  // Binds this expectation to its group and server codecs and validates its responders.
  // Throws std::invalid_argument if a responder cannot be encoded.
  void commit(std::shared_ptr<const CodecGroup> group, const DecoderRegistry& serverDecoders,
              const EncoderRegistry& serverEncoders);

  // Assigns the registration index and the notifier of counter changes.
  void attach(std::size_t index, std::shared_ptr<CallNotifier> notifier) noexcept;

 private:
  vector<Responder> _responders;
  CallCount _callCount;
  DecoderRegistry _decoders;
  EncoderRegistry _encoders;
  std::string _description;
  std::shared_ptr<const CodecGroup> _group;
  DecoderChain _decoderChain;
  EncoderChain _encoderChain;
  mutable CallCounter _counter;
  std::size_t _index{0};
};

}  // namespace decoy
