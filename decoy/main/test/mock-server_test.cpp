#include "decoy/mock-server.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "decoy/call-count.hpp"
#include "decoy/codec-registry.hpp"
#include "decoy/exception.hpp"
#include "decoy/expectation-set.hpp"
#include "decoy/http-method.hpp"
#include "decoy/http-status-code.hpp"
#include "decoy/in-process-listener.hpp"
#include "decoy/message-matcher.hpp"
#include "decoy/mock-server-config.hpp"
#include "decoy/reaction.hpp"
#include "decoy/request-view.hpp"
#include "decoy/responder.hpp"
#include "decoy/value-matcher.hpp"
#include "decoy/websocket-sender.hpp"

namespace decoy {

namespace {

using std::chrono::milliseconds;

struct Greeting {
  std::string name;
};

}  // namespace

TEST(MockServer, LifecycleTransitions) {
  MockServer server;
  EXPECT_FALSE(server.isConfigured());
  EXPECT_FALSE(server.isRunning());

  server.configure([](MockServerConfig& config) { config.withPort(9000).withNbThreads(2); });
  EXPECT_TRUE(server.isConfigured());

  server.start();
  EXPECT_TRUE(server.isRunning());
  EXPECT_EQ(server.port(), 9000);
  EXPECT_THROW(server.start(), exception);
  EXPECT_THROW(server.configure([](MockServerConfig&) {}), exception);
  EXPECT_THROW(server.globalDecoders([](DecoderRegistry&) {}), exception);
  EXPECT_THROW(server.globalEncoders([](EncoderRegistry&) {}), exception);

  server.close();
  EXPECT_FALSE(server.isRunning());
  server.stop();

  // restartable
  server.start();
  EXPECT_TRUE(server.isRunning());
}

TEST(MockServer, InvalidConfiguration) {
  EXPECT_THROW((void)MockServer(MockServerConfig{}.withNbThreads(0)), std::invalid_argument);

  MockServer server;
  EXPECT_THROW(server.configure([](MockServerConfig& config) { config.withNoMatchStatus(42); }),
               std::invalid_argument);
  EXPECT_FALSE(server.isConfigured());
  EXPECT_EQ(server.config().noMatchStatus, http::StatusCodeNotFound);
}

TEST(MockServer, HandleMatchesAndCounts) {
  MockServer server;
  server.expectations([](ExpectationSet& set) {
    set.expect()
        .method(http::Method::GET)
        .path("/health")
        .respond(Responder().body("up"))
        .times(CallCount::Exactly(2));
  });
  EXPECT_FALSE(server.verify());

  auto response = server.handle(RequestView::From("GET", "/health", {}));
  EXPECT_EQ(response.status, http::StatusCodeOK);
  EXPECT_EQ(response.body, "up");
  EXPECT_FALSE(server.verify());

  response = server.handle(RequestView::From("GET", "/health", {}));
  EXPECT_TRUE(server.verify());

  const auto report = server.verificationReport();
  ASSERT_EQ(report.entries.size(), 1U);
  EXPECT_EQ(report.entries[0].actual, 2U);
  EXPECT_TRUE(report.entries[0].satisfied);
}

TEST(MockServer, NoMatchUsesConfiguredFallback) {
  MockServer server(MockServerConfig{}.withNoMatchStatus(http::StatusCodeNotImplemented).withNoMatchBody("nothing"));
  server.expectations([](ExpectationSet& set) { set.expect().path("/a"); });

  EXPECT_FALSE(server.lastMismatchReport());
  const auto response = server.handle(RequestView::From("POST", "/b?x=1", {}));
  EXPECT_EQ(response.status, http::StatusCodeNotImplemented);
  EXPECT_EQ(response.body, "nothing");
  EXPECT_EQ(response.headerValueOrEmpty("Content-Type"), "text/plain");

  const auto report = server.lastMismatchReport();
  ASSERT_TRUE(report);
  EXPECT_EQ(report->method, "POST");
  EXPECT_EQ(report->target, "/b?x=1");
  ASSERT_EQ(report->entries.size(), 1U);
  EXPECT_EQ(report->entries[0].expectationIndex, 1U);

  // explain does not count
  const auto explained = server.explain(RequestView::From("GET", "/a", {}));
  EXPECT_EQ(explained.nbFailedMatchers(), 0U);
  EXPECT_EQ(server.verificationReport().entries[0].actual, 0U);
}

TEST(MockServer, InvalidBlockRegistersNothing) {
  MockServer server;
  EXPECT_THROW(server.expectations([](ExpectationSet& set) {
    set.expect().path("/fine");
    set.expect().path("/greeting").respond(Responder().object(Greeting{"bob"}, "application/json"));
  }),
               std::invalid_argument);
  EXPECT_TRUE(server.verificationReport().entries.empty());

  EXPECT_THROW(server.expectations([](ExpectationSet& set) {
    set.expect().path("/fine");
    throw std::runtime_error("configuration bug");
  }),
               std::runtime_error);
  EXPECT_TRUE(server.verificationReport().entries.empty());
}

TEST(MockServer, GlobalEncodersApplyToLaterBlocks) {
  MockServer server;
  server.globalEncoders([](EncoderRegistry& encoders) {
    encoders.add<Greeting>("application/json", [](const Greeting& greeting, EncodingContext&) {
      return "{\"name\":\"" + greeting.name + "\"}";
    });
  });
  server.expectations([](ExpectationSet& set) {
    set.expect().path("/greeting").respond(Responder().object(Greeting{"bob"}, "application/json"));
  });
  const auto response = server.handle(RequestView::From("GET", "/greeting", {}));
  EXPECT_EQ(response.body, "{\"name\":\"bob\"}");
  EXPECT_EQ(response.headerValueOrEmpty("Content-Type"), "application/json");
}

TEST(MockServer, GlobalCodecsAreFrozenOnceExpectationsAreRegistered) {
  MockServer server;
  const auto addGreetingEncoder = [](EncoderRegistry& encoders) {
    encoders.add<Greeting>("application/json", [](const Greeting& greeting, EncodingContext&) { return greeting.name; });
  };
  server.globalEncoders(addGreetingEncoder);
  server.expectations([](ExpectationSet& set) {
    set.expect().path("/greeting").respond(Responder().object(Greeting{"bob"}, "application/json"));
  });
  EXPECT_THROW(server.globalEncoders([](EncoderRegistry& encoders) { encoders.clear(); }), exception);
  EXPECT_THROW(server.globalDecoders([](DecoderRegistry&) {}), exception);
  EXPECT_EQ(server.handle(RequestView::From("GET", "/greeting", {})).body, "bob");

  server.clearExpectations();
  server.globalEncoders(addGreetingEncoder);
}

TEST(MockServer, RequirementsAreAndedIntoExpectations) {
  MockServer server;
  server.expectations([](ExpectationSet& set) { set.expect().pathGlob("/api/**").respond(Responder().body("ok")); });
  server.requirements(
      [](RequirementSet& set) { set.require().pathGlob("/api/**").header("Authorization", ValueMatcher::Present()); });

  EXPECT_EQ(server.handle(RequestView::From("GET", "/api/users", {})).status, http::StatusCodeNotFound);
  EXPECT_EQ(server.handle(RequestView::From("GET", "/api/users", NamedValues{{"Authorization", "Bearer t"}})).body,
            "ok");
}

TEST(MockServer, ClearExpectationsResetsCounters) {
  MockServer server;
  server.expectations([](ExpectationSet& set) { set.expect().path("/a"); });
  server.webSocketExpectations([](WebSocketExpectationSet& set) { set.expect().path("/ws"); });
  (void)server.handle(RequestView::From("GET", "/zzz", {}));
  ASSERT_TRUE(server.lastMismatchReport());

  server.clearExpectations();
  EXPECT_TRUE(server.verificationReport().entries.empty());
  EXPECT_TRUE(server.verify());
  EXPECT_FALSE(server.lastMismatchReport());
  EXPECT_EQ(server.upgrade(RequestView::From("GET", "/ws", {}), std::make_shared<websocket::FrameBufferSender>()),
            nullptr);
}

TEST(MockServer, WebSocketExpectationsTakePartInVerification) {
  MockServer server;
  server.webSocketExpectations([](WebSocketExpectationSet& set) {
    set.expect().path("/ws").on(websocket::MessageMatcher::Text("ping"), websocket::Reaction::Text("pong"));
  });
  EXPECT_FALSE(server.verify());
  ASSERT_EQ(server.verificationReport().entries.size(), 2U);

  auto sender = std::make_shared<websocket::FrameBufferSender>();
  auto session = server.upgrade(RequestView::From("GET", "/ws", {}), sender);
  ASSERT_NE(session, nullptr);
  EXPECT_FALSE(server.verify());

  (void)session->onMessage(websocket::Message::Text("ping"));
  EXPECT_TRUE(server.verify(milliseconds(500)));
}

TEST(MockServer, ServesThroughTheInProcessListener) {
  auto listener = std::make_unique<InProcessListener>();
  InProcessListener* client = listener.get();
  MockServer server(MockServerConfig{}.withNbThreads(3), std::move(listener));
  server.expectations([](ExpectationSet& set) {
    set.expect().method(http::Method::POST).path("/orders").body("{}").respond(
        Responder(http::StatusCodeCreated).body("{\"id\":1}", "application/json"));
  });
  server.start();

  const auto created = client->send("POST", "/orders", NamedValues{{"Content-Type", "application/json"}}, "{}");
  EXPECT_EQ(created.status, http::StatusCodeCreated);
  EXPECT_EQ(created.body, "{\"id\":1}");

  const auto notFound = client->send("POST", "/orders", {}, "{\"x\":1}");
  EXPECT_EQ(notFound.status, http::StatusCodeNotFound);

  EXPECT_TRUE(server.verify());
  server.stop();
}

}  // namespace decoy
