#include "decoy/match-engine.hpp"

#include <string>
#include <utility>

#include "decoy/expectation-store.hpp"
#include "decoy/expectation.hpp"
#include "decoy/log.hpp"
#include "decoy/matcher.hpp"
#include "decoy/mismatch-report.hpp"
#include "decoy/request-view.hpp"

namespace decoy {

bool MatchEngine::Matches(const Expectation& expectation, const ExpectationSnapshot& snapshot, MatchContext& ctx) {
  const DecoderChain& decoders = expectation.decoderChain();
  const auto passes = [&ctx, &decoders](const Matcher& matcher) { return matcher.matches(ctx, decoders); };
  if (!expectation.forEachMatcher(passes)) {
    return false;
  }
  for (const auto& requirement : snapshot.requirements) {
    if (requirement->appliesTo(ctx) && !requirement->forEachConstraint(passes)) {
      return false;
    }
  }
  return true;
}

MismatchReport MatchEngine::BuildReport(const ExpectationSnapshot& snapshot, MatchContext& ctx) {
  MismatchReport report;
  report.method = ctx.request().method();
  report.target = ctx.request().target();
  report.entries.reserve(snapshot.expectations.size());
  for (const auto& expectation : snapshot.expectations) {
    auto& entry = report.entries.emplace_back();
    entry.expectationIndex = expectation->index();
    entry.expectationDescription = expectation->describe();
    const DecoderChain& decoders = expectation->decoderChain();
    expectation->forEachMatcher([&](const Matcher& matcher) {
      entry.outcomes.push_back(matcher.evaluate(ctx, decoders));
      return true;
    });
    for (const auto& requirement : snapshot.requirements) {
      if (!requirement->appliesTo(ctx)) {
        continue;
      }
      requirement->forEachConstraint([&](const Matcher& matcher) {
        auto outcome = matcher.evaluate(ctx, decoders);
        outcome.description.insert(0, "requirement: ");
        entry.outcomes.push_back(std::move(outcome));
        return true;
      });
    }
  }
  return report;
}

MatchResult MatchEngine::match(const RequestView& request) const {
  const auto snapshot = _store.snapshot();
  MatchContext ctx(request, _maxDecompressedBytes);
  MatchResult result;
  for (const auto& expectation : snapshot->expectations) {
    if (Matches(*expectation, *snapshot, ctx)) {
      result.callIndex = expectation->recordCall();
      result.expectation = expectation;
      log::debug("{} {} matched expectation {} (call {})", request.method(), request.target(), expectation->index(),
                 result.callIndex);
      return result;
    }
  }
  result.mismatchReport = BuildReport(*snapshot, ctx);
  log::info("{} {} matched no expectation", request.method(), request.target());
  return result;
}

MismatchReport MatchEngine::explain(const RequestView& request) const {
  const auto snapshot = _store.snapshot();
  MatchContext ctx(request, _maxDecompressedBytes);
  return BuildReport(*snapshot, ctx);
}

}  // namespace decoy
