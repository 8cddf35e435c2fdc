#include "decoy/websocket-expectation.hpp"

#include <spdlog/fmt/fmt.h>

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include "decoy/call-count.hpp"
#include "decoy/call-counter.hpp"
#include "decoy/codec-registry.hpp"
#include "decoy/matcher.hpp"
#include "decoy/message-matcher.hpp"
#include "decoy/reaction.hpp"
#include "decoy/vector.hpp"
#include "decoy/verification-tracker.hpp"
#include "decoy/websocket-message.hpp"

namespace decoy::websocket {

WebSocketExpectation& WebSocketExpectation::on(MessageMatcher matcher, Reaction reaction, CallCount callCount) {
  _rules.push_back(std::make_unique<ReactionRule>(std::move(matcher), std::move(reaction), std::move(callCount)));
  return *this;
}

WebSocketExpectation& WebSocketExpectation::onConnect(Reaction reaction) {
  _connectReactions.push_back(std::move(reaction));
  return *this;
}

WebSocketExpectation& WebSocketExpectation::connections(CallCount callCount) {
  _connectionCount = std::move(callCount);
  return *this;
}

WebSocketExpectation& WebSocketExpectation::description(std::string_view description) {
  _description = description;
  return *this;
}

bool WebSocketExpectation::matchesUpgrade(MatchContext& ctx) const {
  // the opening handshake has no body to decode
  static const DecoderChain kNoDecoders;
  return forEachMatcher([&ctx](const Matcher& matcher) { return matcher.matches(ctx, kNoDecoders); });
}

const ReactionRule* WebSocketExpectation::findRule(const Message& message) const noexcept {
  for (const auto& rule : _rules) {
    if (rule->matcher().matches(message)) {
      return rule.get();
    }
  }
  return nullptr;
}

void WebSocketExpectation::recordUnmatched(const Message& message) const {
  std::scoped_lock lock(_unmatchedMutex);
  _unmatched.push_back(message);
}

vector<Message> WebSocketExpectation::unmatchedMessages() const {
  std::scoped_lock lock(_unmatchedMutex);
  return _unmatched;
}

std::string WebSocketExpectation::describe() const {
  std::string ret;
  forEachMatcher([&ret](const Matcher& matcher) {
    if (!ret.empty()) {
      ret.append(" and ");
    }
    ret.append(matcher.describe());
    return true;
  });
  if (ret.empty()) {
    ret = "any upgrade";
  }
  if (!_description.empty()) {
    ret = fmt::format("{} ({})", _description, ret);
  }
  return ret;
}

void WebSocketExpectation::attach(std::size_t index, const std::shared_ptr<CallNotifier>& notifier) noexcept {
  _index = index;
  _connectionCounter.setNotifier(notifier);
  for (auto& rule : _rules) {
    rule->setNotifier(notifier);
  }
}

void WebSocketExpectation::collect(VerificationReport& report) const {
  const std::string description = describe();
  {
    const uint64_t actual = nbConnections();
    auto& entry = report.entries.emplace_back();
    entry.subject = fmt::format("websocket expectation {}", _index);
    entry.description = fmt::format("connections to {}", description);
    entry.constraint = _connectionCount.describe();
    entry.actual = actual;
    entry.satisfied = VerificationTracker::Test(_connectionCount, actual);
  }
  for (std::size_t pos = 0; pos < _rules.size(); ++pos) {
    const ReactionRule& rule = *_rules[pos];
    const uint64_t actual = rule.nbReactions();
    auto& entry = report.entries.emplace_back();
    entry.subject = fmt::format("websocket expectation {} reaction {}", _index, pos + 1U);
    entry.description = fmt::format("on {} {}", rule.matcher().describe(), rule.reaction().describe());
    entry.constraint = rule.callCount().describe();
    entry.actual = actual;
    entry.satisfied = VerificationTracker::Test(rule.callCount(), actual);
  }
}

}  // namespace decoy::websocket
