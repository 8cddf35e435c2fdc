#include "decoy/expectation-set.hpp"

#include <memory>
#include <utility>

#include "decoy/codec-registry.hpp"
#include "decoy/expectation.hpp"
#include "decoy/vector.hpp"
#include "decoy/websocket-expectation.hpp"

namespace decoy {

ExpectationSet::ExpectationSet() : _group(std::make_shared<CodecGroup>()) {}

Expectation& ExpectationSet::expect() { return *_expectations.emplace_back(std::make_shared<Expectation>()); }

ExpectationSet& ExpectationSet::decoders(const DecodersConfigurator& configurator) {
  configurator(_group->decoders);
  return *this;
}

ExpectationSet& ExpectationSet::encoders(const EncodersConfigurator& configurator) {
  configurator(_group->encoders);
  return *this;
}

vector<std::shared_ptr<Expectation>> ExpectationSet::commit(const DecoderRegistry& serverDecoders,
                                                            const EncoderRegistry& serverEncoders) {
  // an empty group is not worth a chain level
  std::shared_ptr<const CodecGroup> group;
  if (!_group->decoders.empty() || !_group->encoders.empty()) {
    group = _group;
  }
  for (auto& expectation : _expectations) {
    expectation->commit(group, serverDecoders, serverEncoders);
  }
  return std::exchange(_expectations, {});
}

Requirement& RequirementSet::require() { return *_requirements.emplace_back(std::make_shared<Requirement>()); }

vector<std::shared_ptr<const Requirement>> RequirementSet::release() {
  vector<std::shared_ptr<const Requirement>> ret;
  ret.reserve(_requirements.size());
  for (auto& requirement : _requirements) {
    ret.push_back(std::move(requirement));
  }
  _requirements.clear();
  return ret;
}

websocket::WebSocketExpectation& WebSocketExpectationSet::expect() {
  return *_expectations.emplace_back(std::make_shared<websocket::WebSocketExpectation>());
}

}  // namespace decoy
