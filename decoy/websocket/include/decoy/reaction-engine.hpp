#pragma once

#include <cstddef>
#include <memory>
#include <shared_mutex>

#include "decoy/call-counter.hpp"
#include "decoy/request-view.hpp"
#include "decoy/vector.hpp"
#include "decoy/verification-tracker.hpp"
#include "decoy/websocket-expectation.hpp"
#include "decoy/websocket-sender.hpp"
#include "decoy/websocket-session.hpp"

namespace decoy::websocket {

// Registry of the WebSocket expectations of one server, selecting the expectation of each upgraded connection.
// Like the HTTP expectation store, registration publishes a new immutable list and counters share the store
// notifier so that verify(timeout) wakes up on connections and reactions.
class ReactionEngine {
 public:
  using Expectations = vector<std::shared_ptr<const WebSocketExpectation>>;

  explicit ReactionEngine(std::shared_ptr<CallNotifier> notifier);

  // Appends 'expectations' in order, assigning them their registration index.
  void add(vector<std::shared_ptr<WebSocketExpectation>> expectations);

  void clear();

  [[nodiscard]] std::size_t size() const;

  [[nodiscard]] std::shared_ptr<const Expectations> snapshot() const;

  // Selects the first expectation, in registration order, whose matchers pass for the handshake 'request', and
  // returns a connected session bound to it and to 'sender'. Returns nullptr if no expectation matches.
  [[nodiscard]] std::shared_ptr<WebSocketSession> upgrade(const RequestView& request,
                                                          std::shared_ptr<WebSocketSender> sender) const;

  // Appends the verification entries of all WebSocket expectations.
  void collect(VerificationReport& report) const;

 private:
  mutable std::shared_mutex _mutex;
  std::shared_ptr<const Expectations> _expectations;
  std::shared_ptr<CallNotifier> _notifier;
};

}  // namespace decoy::websocket
