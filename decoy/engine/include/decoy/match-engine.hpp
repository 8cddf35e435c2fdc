#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

#include "decoy/expectation-store.hpp"
#include "decoy/expectation.hpp"
#include "decoy/matcher.hpp"
#include "decoy/mismatch-report.hpp"
#include "decoy/request-view.hpp"

namespace decoy {

struct MatchResult {
  // Selected expectation, nullptr if none matched.
  std::shared_ptr<const Expectation> expectation;
  // 1-based index of this call among the calls of the selected expectation.
  uint64_t callIndex{0};
  // Set only when no expectation matched.
  std::optional<MismatchReport> mismatchReport;

  [[nodiscard]] bool matched() const noexcept { return expectation != nullptr; }
};

// Selects the expectation answering a request.
// Expectations are tried in registration order and the first one whose matchers all pass wins. The matchers of an
// expectation are its own ones (method, path, then the others in registration order) followed by the ones of every
// requirement applying to the request. Evaluation of an expectation stops at its first failing matcher.
// Safe to call concurrently.
class MatchEngine {
 public:
  // 'maxDecompressedBytes' bounds the inflated size of compressed request bodies (0 means unlimited).
  explicit MatchEngine(const ExpectationStore& store, std::size_t maxDecompressedBytes = 0) noexcept
      : _store(store), _maxDecompressedBytes(maxDecompressedBytes) {}

  // Selects the expectation and counts the call on it, or builds the mismatch report if none matches.
  [[nodiscard]] MatchResult match(const RequestView& request) const;

  // Evaluates every matcher of every expectation against 'request', without counting any call.
  [[nodiscard]] MismatchReport explain(const RequestView& request) const;

 private:
  [[nodiscard]] static bool Matches(const Expectation& expectation, const ExpectationSnapshot& snapshot,
                                    MatchContext& ctx);

  [[nodiscard]] static MismatchReport BuildReport(const ExpectationSnapshot& snapshot, MatchContext& ctx);

  const ExpectationStore& _store;
  std::size_t _maxDecompressedBytes;
};

}  // namespace decoy
