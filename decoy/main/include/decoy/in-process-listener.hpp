#pragma once

#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "decoy/compression-config.hpp"
#include "decoy/listener.hpp"
#include "decoy/mock-server-config.hpp"
#include "decoy/named-value.hpp"
#include "decoy/request-view.hpp"
#include "decoy/response-description.hpp"
#include "decoy/timedef.hpp"
#include "decoy/websocket-constants.hpp"
#include "decoy/websocket-frame.hpp"
#include "decoy/websocket-message.hpp"
#include "decoy/websocket-sender.hpp"
#include "decoy/websocket-session.hpp"
#include "decoy/worker-pool.hpp"

namespace decoy {

// Client end of a WebSocket connection opened on an InProcessListener.
// Messages are serialized into masked frames like a real client would, then decoded and dispatched to the server
// session on a worker of the listener, in sending order.
class InProcessWebSocket : public std::enable_shared_from_this<InProcessWebSocket> {
 public:
  InProcessWebSocket(std::weak_ptr<WorkerPool> pool, std::shared_ptr<websocket::FrameBufferSender> serverFrames,
                     std::shared_ptr<websocket::WebSocketSession> session);

  void send(const websocket::Message& message);

  void sendText(std::string_view text) { send(websocket::Message::Text(text)); }

  void sendBinary(std::string_view bytes) { send(websocket::Message::Binary(bytes)); }

  // Starts the closing handshake.
  // Like send(), throws decoy::exception if the listener is stopped.
  void close(websocket::CloseCode code = websocket::CloseCode::Normal, std::string_view reason = {});

  // Next message sent by the server, control frames included, or std::nullopt if none arrived within 'timeout'.
  [[nodiscard]] std::optional<websocket::Message> receive(Duration timeout);

  [[nodiscard]] websocket::WebSocketSession& session() const noexcept { return *_session; }

 private:
  void enqueueFrame(websocket::Opcode opcode, std::string_view payload);

  void dispatchPending();

  // the listener owns the pool, sends fail once it is stopped
  std::weak_ptr<WorkerPool> _pool;
  std::shared_ptr<websocket::FrameBufferSender> _serverFrames;
  std::shared_ptr<websocket::WebSocketSession> _session;

  std::mutex _inboundMutex;
  std::string _inbound;
  websocket::FrameDecoder _serverDecoder{true};

  std::mutex _receiveMutex;
  websocket::FrameDecoder _clientDecoder{false};
};

// Listener without sockets: requests are submitted by the caller, as already parsed RequestViews, and served
// concurrently by a pool of 'nbThreads' workers. Responses come back as futures with compression applied.
// The port reported is the configured one.
class InProcessListener : public Listener {
 public:
  InProcessListener() noexcept = default;

  InProcessListener(const InProcessListener&) = delete;
  InProcessListener(InProcessListener&&) = delete;
  InProcessListener& operator=(const InProcessListener&) = delete;
  InProcessListener& operator=(InProcessListener&&) = delete;

  ~InProcessListener() override;

  void start(const MockServerConfig& config, RequestDispatcher& dispatcher) override;

  void stop() noexcept override;

  [[nodiscard]] uint16_t port() const noexcept override { return _port; }

  [[nodiscard]] bool isStarted() const;

  // Dispatches 'request' on a worker. Throws decoy::exception if the listener is not started.
  [[nodiscard]] std::future<ResponseDescription> submit(RequestView request);

  // Builds the request view (flagged secure if the listener is) then dispatches it.
  [[nodiscard]] std::future<ResponseDescription> submit(std::string_view method, std::string_view target,
                                                        NamedValues headers = {}, std::string_view body = {});

  // Blocking variant of submit().
  ResponseDescription send(std::string_view method, std::string_view target, NamedValues headers = {},
                           std::string_view body = {}) {
    return submit(method, target, std::move(headers), body).get();
  }

  // Performs the opening handshake on 'target' with the additional 'headers'.
  // Returns nullptr if the server rejected the upgrade.
  [[nodiscard]] std::shared_ptr<InProcessWebSocket> openWebSocket(std::string_view target, NamedValues headers = {});

 private:
  [[nodiscard]] const std::shared_ptr<WorkerPool>& pool();

  mutable std::mutex _mutex;
  std::shared_ptr<WorkerPool> _pool;
  RequestDispatcher* _dispatcher{nullptr};
  CompressionConfig _compression;
  uint16_t _port{0};
  bool _secure{false};
};

}  // namespace decoy
