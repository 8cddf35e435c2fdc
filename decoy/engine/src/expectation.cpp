#include "decoy/expectation.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "decoy/call-count.hpp"
#include "decoy/call-counter.hpp"
#include "decoy/codec-registry.hpp"
#include "decoy/matcher.hpp"
#include "decoy/responder.hpp"
#include "decoy/vector.hpp"

namespace decoy {

namespace {

template <class Builder>
std::string DescribeMatchers(const Builder& builder) {
  std::string ret;
  builder.forEachMatcher([&ret](const Matcher& matcher) {
    if (!ret.empty()) {
      ret.append(" and ");
    }
    ret.append(matcher.describe());
    return true;
  });
  return ret;
}

}  // namespace

bool Requirement::appliesTo(MatchContext& ctx) const {
  // scope matchers never decode the body
  static const DecoderChain kNoDecoders;
  if (methodMatcher() && !methodMatcher()->matches(ctx, kNoDecoders)) {
    return false;
  }
  return !pathMatcher() || pathMatcher()->matches(ctx, kNoDecoders);
}

std::string Requirement::describeScope() const {
  if (!methodMatcher() && !pathMatcher()) {
    return "all requests";
  }
  std::string ret;
  if (methodMatcher()) {
    ret.append(methodMatcher()->describe());
  }
  if (pathMatcher()) {
    if (!ret.empty()) {
      ret.append(" and ");
    }
    ret.append(pathMatcher()->describe());
  }
  return ret;
}

Expectation& Expectation::respond(Responder responder) {
  _responders.push_back(std::move(responder));
  return *this;
}

Expectation& Expectation::times(CallCount callCount) {
  _callCount = std::move(callCount);
  return *this;
}

Expectation& Expectation::decoders(const DecodersConfigurator& configurator) {
  configurator(_decoders);
  return *this;
}

Expectation& Expectation::encoders(const EncodersConfigurator& configurator) {
  configurator(_encoders);
  return *this;
}

Expectation& Expectation::description(std::string_view description) {
  _description = description;
  return *this;
}

const Responder* Expectation::responderFor(uint64_t callIndex) const noexcept {
  if (_responders.empty()) {
    return nullptr;
  }
  const auto pos = std::min<uint64_t>(std::max<uint64_t>(callIndex, 1), _responders.size()) - 1U;
  return &_responders[static_cast<std::size_t>(pos)];
}

std::string Expectation::describe() const {
  std::string matchers = DescribeMatchers(*this);
  if (matchers.empty()) {
    matchers = "any request";
  }
  if (_description.empty()) {
    return matchers;
  }
  return fmt::format("{} ({})", _description, matchers);
}

void Expectation::commit(std::shared_ptr<const CodecGroup> group, const DecoderRegistry& serverDecoders,
                         const EncoderRegistry& serverEncoders) {
  _group = std::move(group);

  vector<const DecoderRegistry*> decoderRegistries;
  vector<const EncoderRegistry*> encoderRegistries;
  decoderRegistries.push_back(&_decoders);
  encoderRegistries.push_back(&_encoders);
  if (_group) {
    decoderRegistries.push_back(&_group->decoders);
    encoderRegistries.push_back(&_group->encoders);
  }
  decoderRegistries.push_back(&serverDecoders);
  encoderRegistries.push_back(&serverEncoders);
  _decoderChain = DecoderChain(std::move(decoderRegistries));
  _encoderChain = EncoderChain(std::move(encoderRegistries));

  for (std::size_t pos = 0; pos < _responders.size(); ++pos) {
    try {
      _responders[pos].validate(_encoderChain);
    } catch (const std::invalid_argument& ex) {
      throw std::invalid_argument(fmt::format("Responder {} of expectation '{}': {}", pos + 1U, describe(), ex.what()));
    }
  }
}

void Expectation::attach(std::size_t index, std::shared_ptr<CallNotifier> notifier) noexcept {
  _index = index;
  _counter.setNotifier(std::move(notifier));
}

}  // namespace decoy
