#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string_view>

#include "decoy/reaction.hpp"
#include "decoy/websocket-constants.hpp"
#include "decoy/websocket-expectation.hpp"
#include "decoy/websocket-message.hpp"
#include "decoy/websocket-sender.hpp"
#include "decoy/worker-pool.hpp"

namespace decoy::websocket {

// State of one upgraded connection bound to the WebSocket expectation that accepted it.
// Inbound messages are matched on the calling thread. Reactions are sent on the session's own strand, in the
// order they were triggered, so that the thread delivering a message never waits for the reaction delay.
class WebSocketSession {
 public:
  enum class State : uint8_t { awaitingConnect, connected, closed };

  enum class Outcome : uint8_t {
    // a rule matched, its reaction is scheduled
    reacted,
    // no rule matched, the message is recorded on the expectation
    unmatched,
    // control frame or message received while not connected
    ignored
  };

  WebSocketSession(std::shared_ptr<const WebSocketExpectation> expectation, std::shared_ptr<WebSocketSender> sender);

  WebSocketSession(const WebSocketSession&) = delete;
  WebSocketSession(WebSocketSession&&) = delete;
  WebSocketSession& operator=(const WebSocketSession&) = delete;
  WebSocketSession& operator=(WebSocketSession&&) = delete;

  // Sends the reactions already scheduled before returning.
  ~WebSocketSession();

  // Marks the connection as established, counts it on the expectation and schedules the greeting reactions.
  // Throws decoy::exception if called twice.
  void connect();

  Outcome onMessage(const Message& message);

  // Server initiated close. No-op if already closed.
  void close(CloseCode code = CloseCode::GoingAway, std::string_view reason = {});

  // Blocks until all scheduled reactions have been sent.
  void waitIdle() { _strand.waitIdle(); }

  [[nodiscard]] State state() const noexcept { return _state.load(std::memory_order_acquire); }

  [[nodiscard]] const WebSocketExpectation& expectation() const noexcept { return *_expectation; }

 private:
  void schedule(const Reaction& reaction, const ReactionRule* rule);

  void perform(const Reaction& reaction, const ReactionRule* rule);

  void sendClose(CloseCode code, std::string_view reason);

  std::shared_ptr<const WebSocketExpectation> _expectation;
  std::shared_ptr<WebSocketSender> _sender;
  std::atomic<State> _state{State::awaitingConnect};
  std::atomic<bool> _closeSent{false};
  // last member: joined first on destruction, while the sender and the expectation are still alive
  WorkerPool _strand{1};
};

}  // namespace decoy::websocket
