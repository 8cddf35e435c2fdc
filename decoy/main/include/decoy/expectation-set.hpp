#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <utility>

#include "decoy/codec-registry.hpp"
#include "decoy/expectation.hpp"
#include "decoy/vector.hpp"
#include "decoy/websocket-expectation.hpp"

namespace decoy {

// Expectations declared in one MockServer::expectations() block. They share the codecs registered on the set, and
// are registered all together, in declaration order, once the block completed successfully.
class ExpectationSet {
 public:
  using DecodersConfigurator = std::function<void(DecoderRegistry&)>;
  using EncodersConfigurator = std::function<void(EncoderRegistry&)>;

  ExpectationSet();

  // Declares a new expectation. The reference stays valid until the end of the block.
  Expectation& expect();

  // Codecs consulted by the expectations of this set after their own ones, before the server wide ones.
  ExpectationSet& decoders(const DecodersConfigurator& configurator);

  ExpectationSet& encoders(const EncodersConfigurator& configurator);

  [[nodiscard]] std::size_t size() const noexcept { return _expectations.size(); }

  // Binds all expectations to the set and server codecs, validating their responders.
  // Throws std::invalid_argument on the first invalid expectation, in which case none should be registered.
  [[nodiscard]] vector<std::shared_ptr<Expectation>> commit(const DecoderRegistry& serverDecoders,
                                                            const EncoderRegistry& serverEncoders);

 private:
  std::shared_ptr<CodecGroup> _group;
  vector<std::shared_ptr<Expectation>> _expectations;
};

// Requirements declared in one MockServer::requirements() block.
class RequirementSet {
 public:
  // Declares a new requirement. Its method and path, if set, restrict the requests it applies to.
  Requirement& require();

  [[nodiscard]] std::size_t size() const noexcept { return _requirements.size(); }

  [[nodiscard]] vector<std::shared_ptr<const Requirement>> release();

 private:
  vector<std::shared_ptr<Requirement>> _requirements;
};

// WebSocket expectations declared in one MockServer::webSocketExpectations() block.
class WebSocketExpectationSet {
 public:
  websocket::WebSocketExpectation& expect();

  [[nodiscard]] std::size_t size() const noexcept { return _expectations.size(); }

  [[nodiscard]] vector<std::shared_ptr<websocket::WebSocketExpectation>> release() {
    return std::exchange(_expectations, {});
  }

 private:
  vector<std::shared_ptr<websocket::WebSocketExpectation>> _expectations;
};

}  // namespace decoy
