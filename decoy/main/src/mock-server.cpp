#include "decoy/mock-server.hpp"

#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

#include "decoy/exception.hpp"
#include "decoy/expectation-set.hpp"
#include "decoy/in-process-listener.hpp"
#include "decoy/log.hpp"
#include "decoy/match-engine.hpp"
#include "decoy/mismatch-report.hpp"
#include "decoy/mock-server-config.hpp"
#include "decoy/request-view.hpp"
#include "decoy/response-description.hpp"
#include "decoy/response-synthesizer.hpp"
#include "decoy/timedef.hpp"
#include "decoy/verification-tracker.hpp"

namespace decoy {

MockServer::MockServer(MockServerConfig config, std::unique_ptr<Listener> listener)
    : _config(std::move(config)),
      _listener(listener ? std::move(listener) : std::make_unique<InProcessListener>()),
      _notifier(std::make_shared<CallNotifier>()),
      _store(_notifier),
      _reactionEngine(_notifier) {
  _config.validate();
  rebuildEngines();
}

MockServer::~MockServer() { stop(); }

void MockServer::rebuildEngines() {
  _matchEngine = std::make_unique<MatchEngine>(_store, _config.maxDecompressedBodyBytes);
  _synthesizer = std::make_unique<ResponseSynthesizer>(_config.compression);
  _verificationTracker = std::make_unique<VerificationTracker>(_store, _config.verifyPollInterval);
  _verificationTracker->addCollector([this](VerificationReport& report) { _reactionEngine.collect(report); });
}

void MockServer::throwIfRunning(const char* operation) const {
  if (isRunning()) {
    throw exception("Cannot {} while the server is running", operation);
  }
}

// Committed expectations resolve their codec chains against the global registries.
void MockServer::throwIfExpectationsCommitted(const char* operation) const {
  if (_store.size() != 0) {
    throw exception("Cannot {} once expectations are registered, clear them first", operation);
  }
}

MockServer& MockServer::configure(const ConfigConfigurator& configurator) {
  throwIfRunning("configure");
  MockServerConfig config = _config;
  configurator(config);
  config.validate();
  _config = std::move(config);
  rebuildEngines();
  _configured = true;
  return *this;
}

void MockServer::start() {
  bool expected = false;
  if (!_running.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
    throw exception("Mock server already running");
  }
  try {
    _listener->start(_config, *this);
  } catch (const std::exception& ex) {
    _running.store(false, std::memory_order_release);
    log::error("Unable to start the mock server: {}", ex.what());
    throw;
  }
  log::info("Mock server started on port {} with {} expectation(s)", port(), _store.size());
}

void MockServer::stop() noexcept {
  if (!_running.exchange(false, std::memory_order_acq_rel)) {
    return;
  }
  _listener->stop();
  log::info("Mock server stopped");
}

void MockServer::clearExpectations() {
  std::scoped_lock lock(_registrationMutex);
  _store.clear();
  _reactionEngine.clear();
  std::scoped_lock mismatchLock(_mismatchMutex);
  _lastMismatchReport.reset();
  log::debug("Cleared all expectations");
}

MockServer& MockServer::globalDecoders(const DecodersConfigurator& configurator) {
  throwIfRunning("change global decoders");
  std::scoped_lock lock(_registrationMutex);
  throwIfExpectationsCommitted("change global decoders");
  configurator(_globalDecoders);
  return *this;
}

MockServer& MockServer::globalEncoders(const EncodersConfigurator& configurator) {
  throwIfRunning("change global encoders");
  std::scoped_lock lock(_registrationMutex);
  throwIfExpectationsCommitted("change global encoders");
  configurator(_globalEncoders);
  return *this;
}

MockServer& MockServer::expectations(const ExpectationsConfigurator& configurator) {
  ExpectationSet set;
  configurator(set);
  std::scoped_lock lock(_registrationMutex);
  _store.add(set.commit(_globalDecoders, _globalEncoders));
  return *this;
}

MockServer& MockServer::requirements(const RequirementsConfigurator& configurator) {
  RequirementSet set;
  configurator(set);
  std::scoped_lock lock(_registrationMutex);
  _store.addRequirements(set.release());
  return *this;
}

MockServer& MockServer::webSocketExpectations(const WebSocketExpectationsConfigurator& configurator) {
  WebSocketExpectationSet set;
  configurator(set);
  std::scoped_lock lock(_registrationMutex);
  _reactionEngine.add(set.release());
  return *this;
}

bool MockServer::verify() const { return _verificationTracker->verify(); }

bool MockServer::verify(Duration timeout) const { return _verificationTracker->verify(timeout); }

VerificationReport MockServer::verificationReport() const { return _verificationTracker->report(); }

std::optional<MismatchReport> MockServer::lastMismatchReport() const {
  std::scoped_lock lock(_mismatchMutex);
  return _lastMismatchReport;
}

MismatchReport MockServer::explain(const RequestView& request) const { return _matchEngine->explain(request); }

ResponseDescription MockServer::handle(const RequestView& request) {
  MatchResult result = _matchEngine->match(request);
  if (!result.matched()) {
    if (_config.logMismatchReports) {
      log::debug("{}", result.mismatchReport->summary());
    }
    {
      std::scoped_lock lock(_mismatchMutex);
      _lastMismatchReport = std::move(result.mismatchReport);
    }
    return ResponseSynthesizer::NoMatch(_config.noMatchStatus, _config.noMatchBody, _config.noMatchContentType);
  }
  return _synthesizer->synthesize(*result.expectation, result.callIndex, request);
}

std::shared_ptr<websocket::WebSocketSession> MockServer::upgrade(const RequestView& request,
                                                                 std::shared_ptr<websocket::WebSocketSender> sender) {
  return _reactionEngine.upgrade(request, std::move(sender));
}

}  // namespace decoy
