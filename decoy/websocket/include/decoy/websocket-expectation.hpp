#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include "decoy/call-count.hpp"
#include "decoy/call-counter.hpp"
#include "decoy/expectation.hpp"
#include "decoy/matcher.hpp"
#include "decoy/message-matcher.hpp"
#include "decoy/reaction.hpp"
#include "decoy/vector.hpp"
#include "decoy/verification-tracker.hpp"
#include "decoy/websocket-message.hpp"

namespace decoy::websocket {

// Pair of an inbound message matcher and the reaction it triggers, with the number of reactions expected.
class ReactionRule {
 public:
  ReactionRule(MessageMatcher matcher, Reaction reaction, CallCount callCount)
      : _matcher(std::move(matcher)), _reaction(std::move(reaction)), _callCount(std::move(callCount)) {}

  [[nodiscard]] const MessageMatcher& matcher() const noexcept { return _matcher; }

  [[nodiscard]] const Reaction& reaction() const noexcept { return _reaction; }

  [[nodiscard]] const CallCount& callCount() const noexcept { return _callCount; }

  // Number of reactions sent.
  [[nodiscard]] uint64_t nbReactions() const noexcept { return _counter.value(); }

  uint64_t recordReaction() const { return _counter.increment(); }

  void setNotifier(std::shared_ptr<CallNotifier> notifier) noexcept { _counter.setNotifier(std::move(notifier)); }

 private:
  MessageMatcher _matcher;
  Reaction _reaction;
  CallCount _callCount;
  mutable CallCounter _counter;
};

// Rule applying to WebSocket connections whose opening handshake passes its matchers: reactions to send on
// connection and on inbound messages, and the expected number of connections and reactions.
class WebSocketExpectation : public MatcherSetBuilder<WebSocketExpectation> {
 public:
  WebSocketExpectation() = default;

  WebSocketExpectation(const WebSocketExpectation&) = delete;
  WebSocketExpectation(WebSocketExpectation&&) = delete;
  WebSocketExpectation& operator=(const WebSocketExpectation&) = delete;
  WebSocketExpectation& operator=(WebSocketExpectation&&) = delete;

  ~WebSocketExpectation() = default;

  // Reacts to inbound messages passing 'matcher'. Rules are tried in registration order, the first passing one wins.
  // Unless specified, each rule is expected to react at least once.
  WebSocketExpectation& on(MessageMatcher matcher, Reaction reaction, CallCount callCount = {});

  // Reaction sent as soon as the connection is established.
  WebSocketExpectation& onConnect(Reaction reaction);

  // Expected number of connections, at least one by default.
  WebSocketExpectation& connections(CallCount callCount);

  WebSocketExpectation& description(std::string_view description);

  // Whether the opening handshake in 'ctx' passes the matchers of this expectation.
  [[nodiscard]] bool matchesUpgrade(MatchContext& ctx) const;

  // First rule whose matcher passes for 'message', nullptr if none.
  [[nodiscard]] const ReactionRule* findRule(const Message& message) const noexcept;

  [[nodiscard]] const vector<std::unique_ptr<ReactionRule>>& rules() const noexcept { return _rules; }

  [[nodiscard]] const vector<Reaction>& connectReactions() const noexcept { return _connectReactions; }

  [[nodiscard]] const CallCount& connectionCount() const noexcept { return _connectionCount; }

  [[nodiscard]] uint64_t nbConnections() const noexcept { return _connectionCounter.value(); }

  uint64_t recordConnection() const { return _connectionCounter.increment(); }

  void recordUnmatched(const Message& message) const;

  // Inbound data messages that matched no rule, in reception order.
  [[nodiscard]] vector<Message> unmatchedMessages() const;

  [[nodiscard]] std::size_t index() const noexcept { return _index; }

  [[nodiscard]] std::string describe() const;

  // Assigns the registration index and the notifier of counter changes.
  void attach(std::size_t index, const std::shared_ptr<CallNotifier>& notifier) noexcept;

  // Appends the verification entries of this expectation: its connections then each of its rules.
  void collect(VerificationReport& report) const;

 private:
  vector<std::unique_ptr<ReactionRule>> _rules;
  vector<Reaction> _connectReactions;
  CallCount _connectionCount;
  std::string _description;
  mutable CallCounter _connectionCounter;
  mutable std::mutex _unmatchedMutex;
  mutable vector<Message> _unmatched;
  std::size_t _index{0};
};

}  // namespace decoy::websocket
