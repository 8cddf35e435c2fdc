#include "decoy/reaction-engine.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <utility>

#include "decoy/call-counter.hpp"
#include "decoy/log.hpp"
#include "decoy/matcher.hpp"
#include "decoy/request-view.hpp"
#include "decoy/vector.hpp"
#include "decoy/verification-tracker.hpp"
#include "decoy/websocket-expectation.hpp"
#include "decoy/websocket-sender.hpp"
#include "decoy/websocket-session.hpp"

namespace decoy::websocket {

ReactionEngine::ReactionEngine(std::shared_ptr<CallNotifier> notifier)
    : _expectations(std::make_shared<const Expectations>()), _notifier(std::move(notifier)) {
  if (!_notifier) {
    throw std::invalid_argument("ReactionEngine requires a call notifier");
  }
}

void ReactionEngine::add(vector<std::shared_ptr<WebSocketExpectation>> expectations) {
  std::unique_lock<std::shared_mutex> lock(_mutex);
  auto next = std::make_shared<Expectations>(*_expectations);
  next->reserve(next->size() + expectations.size());
  for (auto& expectation : expectations) {
    expectation->attach(next->size() + 1U, _notifier);
    log::debug("Registered websocket expectation {}: {}", expectation->index(), expectation->describe());
    next->push_back(std::move(expectation));
  }
  _expectations = std::move(next);
}

void ReactionEngine::clear() {
  std::unique_lock<std::shared_mutex> lock(_mutex);
  _expectations = std::make_shared<const Expectations>();
  _notifier->notify();
}

std::size_t ReactionEngine::size() const { return snapshot()->size(); }

std::shared_ptr<const ReactionEngine::Expectations> ReactionEngine::snapshot() const {
  std::shared_lock<std::shared_mutex> lock(_mutex);
  return _expectations;
}

std::shared_ptr<WebSocketSession> ReactionEngine::upgrade(const RequestView& request,
                                                          std::shared_ptr<WebSocketSender> sender) const {
  const auto expectations = snapshot();
  MatchContext ctx(request);
  for (const auto& expectation : *expectations) {
    if (!expectation->matchesUpgrade(ctx)) {
      continue;
    }
    auto session = std::make_shared<WebSocketSession>(expectation, std::move(sender));
    session->connect();
    return session;
  }
  log::info("WebSocket upgrade {} matched none of {} websocket expectations", request.path(), expectations->size());
  return nullptr;
}

void ReactionEngine::collect(VerificationReport& report) const {
  for (const auto& expectation : *snapshot()) {
    expectation->collect(report);
  }
}

}  // namespace decoy::websocket
