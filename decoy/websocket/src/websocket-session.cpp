#include "decoy/websocket-session.hpp"

#include <chrono>
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include "decoy/exception.hpp"
#include "decoy/log.hpp"
#include "decoy/reaction.hpp"
#include "decoy/response-synthesizer.hpp"
#include "decoy/websocket-constants.hpp"
#include "decoy/websocket-expectation.hpp"
#include "decoy/websocket-frame.hpp"
#include "decoy/websocket-message.hpp"
#include "decoy/websocket-sender.hpp"

namespace decoy::websocket {

WebSocketSession::WebSocketSession(std::shared_ptr<const WebSocketExpectation> expectation,
                                   std::shared_ptr<WebSocketSender> sender)
    : _expectation(std::move(expectation)), _sender(std::move(sender)) {
  if (!_expectation || !_sender) {
    throw std::invalid_argument("WebSocket session requires an expectation and a sender");
  }
}

WebSocketSession::~WebSocketSession() { _strand.stop(); }

void WebSocketSession::connect() {
  State expected = State::awaitingConnect;
  if (!_state.compare_exchange_strong(expected, State::connected, std::memory_order_acq_rel)) {
    throw exception("WebSocket session already connected");
  }
  const uint64_t nbConnections = _expectation->recordConnection();
  log::debug("WebSocket connection {} accepted by expectation {}", nbConnections, _expectation->index());
  for (const Reaction& reaction : _expectation->connectReactions()) {
    schedule(reaction, nullptr);
  }
}

WebSocketSession::Outcome WebSocketSession::onMessage(const Message& message) {
  if (state() != State::connected) {
    log::debug("Ignoring WebSocket {} frame on a connection that is not open", OpcodeStr(message.opcode));
    return Outcome::ignored;
  }
  switch (message.opcode) {
    case Opcode::Ping:
      if (!_strand.post([this, payload = message.payload]() {
            if (!_closeSent.load(std::memory_order_acquire)) {
              _sender->send(Message{Opcode::Pong, payload});
            }
          })) {
        log::warn("WebSocket session of expectation {} is stopped, dropping pong", _expectation->index());
      }
      return Outcome::ignored;
    case Opcode::Pong:
      return Outcome::ignored;
    case Opcode::Close: {
      _state.store(State::closed, std::memory_order_release);
      const ClosePayload closePayload = ParseClosePayload(message.payload);
      log::debug("WebSocket peer closed the connection with code {}", static_cast<uint16_t>(closePayload.code));
      // echo the status code, as required by the closing handshake
      if (!_strand.post([this, code = closePayload.code]() { sendClose(code, {}); })) {
        log::warn("WebSocket session of expectation {} is stopped, dropping close reply", _expectation->index());
      }
      return Outcome::ignored;
    }
    default:
      break;
  }

  const ReactionRule* rule = _expectation->findRule(message);
  if (rule == nullptr) {
    _expectation->recordUnmatched(message);
    log::debug("WebSocket {} message of {} bytes matched no rule of expectation {}", OpcodeStr(message.opcode),
               message.payload.size(), _expectation->index());
    return Outcome::unmatched;
  }
  schedule(rule->reaction(), rule);
  return Outcome::reacted;
}

void WebSocketSession::close(CloseCode code, std::string_view reason) {
  if (_state.exchange(State::closed, std::memory_order_acq_rel) == State::closed) {
    return;
  }
  if (!_strand.post([this, code, reason = std::string(reason)]() { sendClose(code, reason); })) {
    log::warn("WebSocket session of expectation {} is stopped, dropping close", _expectation->index());
  }
}

void WebSocketSession::schedule(const Reaction& reaction, const ReactionRule* rule) {
  // the expectation outlives the session, so the reaction can be referenced by the task
  if (!_strand.post([this, &reaction, rule]() { perform(reaction, rule); })) {
    log::warn("WebSocket session of expectation {} is stopped, dropping reaction: {}", _expectation->index(),
              reaction.describe());
  }
}

void WebSocketSession::perform(const Reaction& reaction, const ReactionRule* rule) {
  const auto delay = ResponseSynthesizer::DrawDelay(reaction.delaySpec());
  if (delay.count() > 0) {
    std::this_thread::sleep_for(delay);
  }
  if (_closeSent.load(std::memory_order_acquire)) {
    log::debug("WebSocket connection closed, dropping reaction: {}", reaction.describe());
    return;
  }
  try {
    if (reaction.kind() == Reaction::Kind::close) {
      _state.store(State::closed, std::memory_order_release);
      sendClose(reaction.closeCode(), reaction.message().payload);
    } else {
      _sender->send(reaction.message());
    }
  } catch (const std::exception& ex) {
    log::error("Unable to send WebSocket reaction '{}': {}", reaction.describe(), ex.what());
    return;
  }
  if (rule != nullptr) {
    rule->recordReaction();
  }
}

void WebSocketSession::sendClose(CloseCode code, std::string_view reason) {
  if (_closeSent.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  _sender->close(code, reason);
}

}  // namespace decoy::websocket
