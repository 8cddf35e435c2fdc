#include "decoy/in-process-listener.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "decoy/base64.hpp"
#include "decoy/exception.hpp"
#include "decoy/http-constants.hpp"
#include "decoy/log.hpp"
#include "decoy/mock-server-config.hpp"
#include "decoy/named-value.hpp"
#include "decoy/request-view.hpp"
#include "decoy/response-description.hpp"
#include "decoy/response-synthesizer.hpp"
#include "decoy/timedef.hpp"
#include "decoy/websocket-constants.hpp"
#include "decoy/websocket-frame.hpp"
#include "decoy/websocket-message.hpp"
#include "decoy/websocket-sender.hpp"
#include "decoy/websocket-session.hpp"
#include "decoy/websocket-upgrade.hpp"
#include "decoy/worker-pool.hpp"

namespace decoy {

namespace {

std::mt19937& Rng() {
  static thread_local std::mt19937 rng{std::random_device{}()};
  return rng;
}

websocket::MaskingKey GenerateMaskingKey() {
  const uint32_t value = Rng()();
  return {static_cast<uint8_t>(value >> 24), static_cast<uint8_t>(value >> 16), static_cast<uint8_t>(value >> 8),
          static_cast<uint8_t>(value)};
}

// 16 random bytes, base64 encoded
std::string GenerateWebSocketKey() {
  std::array<char, 16> nonce;
  std::uniform_int_distribution<int> dist(0, 255);
  for (char& ch : nonce) {
    ch = static_cast<char>(dist(Rng()));
  }
  return B64Encode(std::string_view(nonce.data(), nonce.size()));
}

}  // namespace

InProcessWebSocket::InProcessWebSocket(std::weak_ptr<WorkerPool> pool,
                                       std::shared_ptr<websocket::FrameBufferSender> serverFrames,
                                       std::shared_ptr<websocket::WebSocketSession> session)
    : _pool(std::move(pool)), _serverFrames(std::move(serverFrames)), _session(std::move(session)) {}

void InProcessWebSocket::send(const websocket::Message& message) { enqueueFrame(message.opcode, message.payload); }

void InProcessWebSocket::close(websocket::CloseCode code, std::string_view reason) {
  std::string payload;
  // the close frame is built unmasked, its payload is then re-framed with a masking key
  websocket::AppendCloseFrame(payload, code, reason);
  enqueueFrame(websocket::Opcode::Close, std::string_view(payload).substr(websocket::kMinFrameHeaderSize));
}

void InProcessWebSocket::enqueueFrame(websocket::Opcode opcode, std::string_view payload) {
  {
    std::scoped_lock lock(_inboundMutex);
    const auto maskingKey = GenerateMaskingKey();
    websocket::AppendFrame(_inbound, opcode, payload, true, &maskingKey);
  }
  const auto pool = _pool.lock();
  if (!pool || !pool->post([self = shared_from_this()]() { self->dispatchPending(); })) {
    throw exception("Listener stopped, cannot send WebSocket message");
  }
}

void InProcessWebSocket::dispatchPending() {
  // holding the lock while dispatching keeps the messages of this connection in order
  std::scoped_lock lock(_inboundMutex);
  _serverDecoder.feed(std::exchange(_inbound, {}));
  try {
    while (auto message = _serverDecoder.next()) {
      _session->onMessage(*message);
    }
  } catch (const std::invalid_argument& ex) {
    log::warn("Closing WebSocket connection: {}", ex.what());
    _session->close(websocket::CloseCode::ProtocolError, "protocol error");
  }
}

std::optional<websocket::Message> InProcessWebSocket::receive(Duration timeout) {
  std::scoped_lock lock(_receiveMutex);
  const SteadyTimePoint deadline = SteadyClock::now() + timeout;
  while (true) {
    if (auto message = _clientDecoder.next()) {
      return message;
    }
    const SteadyTimePoint now = SteadyClock::now();
    if (now >= deadline) {
      return std::nullopt;
    }
    _clientDecoder.feed(_serverFrames->waitBytes(std::chrono::duration_cast<Duration>(deadline - now)));
  }
}

InProcessListener::~InProcessListener() { stop(); }

void InProcessListener::start(const MockServerConfig& config, RequestDispatcher& dispatcher) {
  std::scoped_lock lock(_mutex);
  if (_pool) {
    throw exception("In-process listener already started");
  }
  _pool = std::make_shared<WorkerPool>(config.nbThreads);
  _dispatcher = &dispatcher;
  _compression = config.compression;
  _port = config.port;
  _secure = config.secure;
  log::debug("In-process listener started with {} worker threads", config.nbThreads);
}

void InProcessListener::stop() noexcept {
  std::shared_ptr<WorkerPool> pool;
  {
    std::scoped_lock lock(_mutex);
    pool = std::move(_pool);
    _dispatcher = nullptr;
    _port = 0;
  }
  if (pool) {
    // outside of the lock: queued tasks are completed before the workers are joined
    pool->stop();
    log::debug("In-process listener stopped");
  }
}

bool InProcessListener::isStarted() const {
  std::scoped_lock lock(_mutex);
  return _pool != nullptr;
}

const std::shared_ptr<WorkerPool>& InProcessListener::pool() {
  if (!_pool) {
    throw exception("In-process listener is not started");
  }
  return _pool;
}

std::future<ResponseDescription> InProcessListener::submit(RequestView request) {
  std::scoped_lock lock(_mutex);
  return pool()->submit([dispatcher = _dispatcher, compression = _compression, request = std::move(request)]() {
    ResponseDescription response = dispatcher->handle(request);
    ApplyCompression(response, compression);
    return response;
  });
}

std::future<ResponseDescription> InProcessListener::submit(std::string_view method, std::string_view target,
                                                           NamedValues headers, std::string_view body) {
  bool secure;
  {
    std::scoped_lock lock(_mutex);
    secure = _secure;
  }
  return submit(RequestView::From(method, target, std::move(headers), std::string(body), secure));
}

std::shared_ptr<InProcessWebSocket> InProcessListener::openWebSocket(std::string_view target, NamedValues headers) {
  headers.push_back(NamedValue{std::string(http::Upgrade), std::string(websocket::UpgradeValue)});
  headers.push_back(NamedValue{std::string(http::Connection), std::string(http::Upgrade)});
  headers.push_back(NamedValue{std::string(websocket::SecWebSocketVersion), std::string(websocket::kVersion)});
  headers.push_back(NamedValue{std::string(websocket::SecWebSocketKey), GenerateWebSocketKey()});

  std::scoped_lock lock(_mutex);
  std::weak_ptr<WorkerPool> workers = pool();
  auto request = RequestView::From(http::GET, target, std::move(headers), {}, _secure);
  auto upgraded = _pool->submit([workers, dispatcher = _dispatcher,
                                 request = std::move(request)]() -> std::shared_ptr<InProcessWebSocket> {
    const ResponseDescription handshake = MakeHandshakeResponse(request);
    auto serverFrames = std::make_shared<websocket::FrameBufferSender>();
    auto session = dispatcher->upgrade(request, serverFrames);
    if (!session) {
      return nullptr;
    }
    log::debug("WebSocket handshake on {} accepted with key {}", request.path(),
               handshake.headerValueOrEmpty(websocket::SecWebSocketAccept));
    return std::make_shared<InProcessWebSocket>(workers, std::move(serverFrames), std::move(session));
  });
  return upgraded.get();
}

}  // namespace decoy
