#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

#include "decoy/codec-registry.hpp"
#include "decoy/expectation-set.hpp"
#include "decoy/expectation-store.hpp"
#include "decoy/listener.hpp"
#include "decoy/match-engine.hpp"
#include "decoy/mismatch-report.hpp"
#include "decoy/mock-server-config.hpp"
#include "decoy/reaction-engine.hpp"
#include "decoy/request-view.hpp"
#include "decoy/response-description.hpp"
#include "decoy/response-synthesizer.hpp"
#include "decoy/timedef.hpp"
#include "decoy/verification-tracker.hpp"
#include "decoy/websocket-sender.hpp"
#include "decoy/websocket-session.hpp"

namespace decoy {

// MockServer
//  - Programmable HTTP / WebSocket test double. Expectations (request matchers paired with responses and an expected
//    number of calls) are registered through expectations() blocks, before or after start(): registrations take
//    effect for subsequent requests.
//  - Requests are received by a Listener (InProcessListener by default) which calls handle() / upgrade()
//    concurrently from its workers. The first registered expectation whose matchers all pass answers the request
//    and counts the call. Otherwise the no-match response of the configuration is sent and the mismatch report is
//    kept for diagnostics.
//  - verify() / verify(timeout) check the call count constraints of all expectations, WebSocket ones included.
//    Counters are only reset by clearExpectations().
//  - Configuration and server wide codecs cannot be changed while running.
//
// Typical usage:
//   MockServer server;
//   server.expectations([](ExpectationSet& set) {
//     set.expect().method(http::Method::GET).path("/health").respond(Responder().body("ok", "text/plain"));
//   });
//   server.start();
//   // ... exercise the code under test ...
//   EXPECT_TRUE(server.verify(std::chrono::seconds(1)));
class MockServer : public RequestDispatcher {
 public:
  using ConfigConfigurator = std::function<void(MockServerConfig&)>;
  using ExpectationsConfigurator = std::function<void(ExpectationSet&)>;
  using RequirementsConfigurator = std::function<void(RequirementSet&)>;
  using WebSocketExpectationsConfigurator = std::function<void(WebSocketExpectationSet&)>;
  using DecodersConfigurator = ExpectationSet::DecodersConfigurator;
  using EncodersConfigurator = ExpectationSet::EncodersConfigurator;

  // Throws std::invalid_argument if 'config' is invalid.
  explicit MockServer(MockServerConfig config = {}, std::unique_ptr<Listener> listener = nullptr);

  MockServer(const MockServer&) = delete;
  MockServer(MockServer&&) = delete;
  MockServer& operator=(const MockServer&) = delete;
  MockServer& operator=(MockServer&&) = delete;

  ~MockServer() override;

  // ============================
  // Lifecycle
  // ============================

  // Applies 'configurator' to a copy of the configuration, validates it then installs it.
  // Throws decoy::exception while running, std::invalid_argument if the resulting configuration is invalid.
  MockServer& configure(const ConfigConfigurator& configurator);

  // Whether configure() has been called successfully at least once.
  [[nodiscard]] bool isConfigured() const noexcept { return _configured; }

  // Starts the listener. Throws decoy::exception if already running.
  void start();

  // Stops the listener, completing in-flight requests. Counters are left untouched. Idempotent.
  void stop() noexcept;

  void close() noexcept { stop(); }

  [[nodiscard]] bool isRunning() const noexcept { return _running.load(std::memory_order_acquire); }

  [[nodiscard]] uint16_t port() const noexcept { return _listener->port(); }

  [[nodiscard]] Listener& listener() noexcept { return *_listener; }

  [[nodiscard]] const MockServerConfig& config() const noexcept { return _config; }

  // Removes all expectations, requirements and WebSocket expectations, with their counters.
  void clearExpectations();

  // ============================
  // Registration
  // ============================

  // Server wide codecs, consulted after the expectation and group ones.
  // Throws decoy::exception while running, or once expectations are registered (until clearExpectations()).
  MockServer& globalDecoders(const DecodersConfigurator& configurator);

  MockServer& globalEncoders(const EncodersConfigurator& configurator);

  // Registers the expectations declared by 'configurator', atomically: if 'configurator' throws or if one of the
  // expectations is invalid, none is registered and the exception is propagated.
  MockServer& expectations(const ExpectationsConfigurator& configurator);

  MockServer& requirements(const RequirementsConfigurator& configurator);

  MockServer& webSocketExpectations(const WebSocketExpectationsConfigurator& configurator);

  // ============================
  // Verification & diagnostics
  // ============================

  [[nodiscard]] bool verify() const;

  // Waits up to 'timeout' (VerificationTracker::kWaitForever to wait without deadline) for all constraints to be
  // satisfied.
  [[nodiscard]] bool verify(Duration timeout) const;

  [[nodiscard]] VerificationReport verificationReport() const;

  // Report of the last request that matched no expectation.
  [[nodiscard]] std::optional<MismatchReport> lastMismatchReport() const;

  // Evaluates every expectation against 'request' without counting any call.
  [[nodiscard]] MismatchReport explain(const RequestView& request) const;

  // ============================
  // Dispatch
  // ============================

  ResponseDescription handle(const RequestView& request) override;

  std::shared_ptr<websocket::WebSocketSession> upgrade(const RequestView& request,
                                                       std::shared_ptr<websocket::WebSocketSender> sender) override;

 private:
  void rebuildEngines();

  void throwIfRunning(const char* operation) const;

  void throwIfExpectationsCommitted(const char* operation) const;

  MockServerConfig _config;
  std::unique_ptr<Listener> _listener;
  DecoderRegistry _globalDecoders;
  EncoderRegistry _globalEncoders;
  std::shared_ptr<CallNotifier> _notifier;
  ExpectationStore _store;
  websocket::ReactionEngine _reactionEngine;
  std::unique_ptr<MatchEngine> _matchEngine;
  std::unique_ptr<ResponseSynthesizer> _synthesizer;
  std::unique_ptr<VerificationTracker> _verificationTracker;
  mutable std::mutex _mismatchMutex;
  std::optional<MismatchReport> _lastMismatchReport;
  // serializes registrations so that indexes follow block order
  std::mutex _registrationMutex;
  std::atomic<bool> _running{false};
  bool _configured{false};
};

}  // namespace decoy
