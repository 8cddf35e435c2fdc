#pragma once

#include <cstdint>
#include <memory>

#include "decoy/mock-server-config.hpp"
#include "decoy/request-view.hpp"
#include "decoy/response-description.hpp"
#include "decoy/websocket-sender.hpp"
#include "decoy/websocket-session.hpp"

namespace decoy {

// What a listener calls for each request it receives. Implementations are safe to call concurrently.
class RequestDispatcher {
 public:
  virtual ~RequestDispatcher() = default;

  // Response to send back for 'request'. Never throws for a well formed request.
  virtual ResponseDescription handle(const RequestView& request) = 0;

  // Session handling the WebSocket connection opened by the handshake 'request', messages being sent back through
  // 'sender'. Returns nullptr if the upgrade is rejected, the listener then answers like for an unmatched request.
  virtual std::shared_ptr<websocket::WebSocketSession> upgrade(const RequestView& request,
                                                               std::shared_ptr<websocket::WebSocketSender> sender) = 0;
};

// Transport seam of the mock server: receives requests, normalizes them into RequestViews, hands them to the
// dispatcher and executes the returned response descriptions.
class Listener {
 public:
  virtual ~Listener() = default;

  // Starts accepting requests. Throws decoy::exception if already started.
  virtual void start(const MockServerConfig& config, RequestDispatcher& dispatcher) = 0;

  // Stops accepting requests. In-flight requests are completed. Idempotent.
  virtual void stop() noexcept = 0;

  // Port the listener is bound to, 0 if not started.
  [[nodiscard]] virtual uint16_t port() const noexcept = 0;
};

}  // namespace decoy
