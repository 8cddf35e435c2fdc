#include "decoy/in-process-listener.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <future>
#include <memory>
#include <string>
#include <utility>

#include "decoy/exception.hpp"
#include "decoy/listener.hpp"
#include "decoy/message-matcher.hpp"
#include "decoy/mock-server-config.hpp"
#include "decoy/reaction.hpp"
#include "decoy/request-view.hpp"
#include "decoy/response-description.hpp"
#include "decoy/vector.hpp"
#include "decoy/websocket-constants.hpp"
#include "decoy/websocket-expectation.hpp"
#include "decoy/websocket-message.hpp"
#include "decoy/websocket-sender.hpp"
#include "decoy/websocket-session.hpp"

namespace decoy {

namespace {

using std::chrono::milliseconds;

// Echoes the request target in the body, accepts WebSocket upgrades on "/ws" with an echo rule.
class EchoDispatcher : public RequestDispatcher {
 public:
  EchoDispatcher() {
    _webSocketExpectation->path("/ws")
        .onConnect(websocket::Reaction::Text("hello"))
        .on(websocket::MessageMatcher::Text("ping"), websocket::Reaction::Text("pong"));
  }

  ResponseDescription handle(const RequestView& request) override {
    ++nbHandled;
    ResponseDescription response;
    response.body = std::string(request.target());
    if (request.secure()) {
      response.headers.push_back(NamedValue{"X-Secure", "1"});
    }
    return response;
  }

  std::shared_ptr<websocket::WebSocketSession> upgrade(const RequestView& request,
                                                       std::shared_ptr<websocket::WebSocketSender> sender) override {
    if (request.path() != "/ws") {
      return nullptr;
    }
    auto session = std::make_shared<websocket::WebSocketSession>(_webSocketExpectation, std::move(sender));
    session->connect();
    return session;
  }

  std::atomic<int> nbHandled{0};

 private:
  std::shared_ptr<websocket::WebSocketExpectation> _webSocketExpectation =
      std::make_shared<websocket::WebSocketExpectation>();
};

class InProcessListenerTest : public ::testing::Test {
 protected:
  void SetUp() override { listener.start(MockServerConfig{}.withNbThreads(2).withPort(8080), dispatcher); }

  EchoDispatcher dispatcher;
  InProcessListener listener;
};

}  // namespace

TEST_F(InProcessListenerTest, Lifecycle) {
  EXPECT_TRUE(listener.isStarted());
  EXPECT_EQ(listener.port(), 8080);
  EXPECT_THROW(listener.start(MockServerConfig{}, dispatcher), exception);

  listener.stop();
  EXPECT_FALSE(listener.isStarted());
  EXPECT_EQ(listener.port(), 0);
  EXPECT_THROW((void)listener.submit("GET", "/"), exception);
  // idempotent
  listener.stop();
}

TEST_F(InProcessListenerTest, SubmitDispatchesOnWorkers) {
  vector<std::future<ResponseDescription>> futures;
  for (int requestPos = 0; requestPos < 20; ++requestPos) {
    futures.push_back(listener.submit("GET", "/item/" + std::to_string(requestPos)));
  }
  for (int requestPos = 0; requestPos < 20; ++requestPos) {
    EXPECT_EQ(futures[static_cast<std::size_t>(requestPos)].get().body, "/item/" + std::to_string(requestPos));
  }
  EXPECT_EQ(dispatcher.nbHandled.load(), 20);
}

TEST_F(InProcessListenerTest, SecureFlagComesFromConfig) {
  listener.stop();
  listener.start(MockServerConfig{}.withSecure(), dispatcher);
  const auto response = listener.send("GET", "/secure");
  EXPECT_EQ(response.headerValueOrEmpty("X-Secure"), "1");
}

TEST_F(InProcessListenerTest, WebSocketRoundTrip) {
  auto socket = listener.openWebSocket("/ws");
  ASSERT_NE(socket, nullptr);
  EXPECT_EQ(socket->session().state(), websocket::WebSocketSession::State::connected);

  auto greeting = socket->receive(milliseconds(500));
  ASSERT_TRUE(greeting);
  EXPECT_EQ(*greeting, websocket::Message::Text("hello"));

  socket->sendText("ping");
  auto pong = socket->receive(milliseconds(500));
  ASSERT_TRUE(pong);
  EXPECT_EQ(*pong, websocket::Message::Text("pong"));

  socket->sendText("unknown");
  EXPECT_FALSE(socket->receive(milliseconds(30)));

  socket->close();
  auto closeEcho = socket->receive(milliseconds(500));
  ASSERT_TRUE(closeEcho);
  EXPECT_EQ(closeEcho->opcode, websocket::Opcode::Close);
  EXPECT_EQ(socket->session().state(), websocket::WebSocketSession::State::closed);
}

TEST_F(InProcessListenerTest, RejectedUpgrade) { EXPECT_EQ(listener.openWebSocket("/nope"), nullptr); }

}  // namespace decoy
