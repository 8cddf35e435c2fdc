#pragma once

#include <cstddef>
#include <string>

#include "decoy/matcher.hpp"
#include "decoy/vector.hpp"

namespace decoy {

// Outcomes of all matchers of one expectation (its own ones, then the ones of the requirements applying to it).
struct ExpectationMismatch {
  std::size_t expectationIndex{0};
  std::string expectationDescription;
  vector<MatcherOutcome> outcomes;

  [[nodiscard]] std::size_t nbPassed() const noexcept;

  [[nodiscard]] std::size_t nbFailed() const noexcept { return outcomes.size() - nbPassed(); }
};

// Structured diagnostic of a request that matched no expectation: one entry per registered expectation, in
// registration order. Rendering is left to the caller, summary() is a one line digest for logs.
struct MismatchReport {
  std::string method;
  std::string target;
  vector<ExpectationMismatch> entries;

  [[nodiscard]] std::size_t nbPassedMatchers() const noexcept;

  [[nodiscard]] std::size_t nbFailedMatchers() const noexcept;

  // "GET /a?b=1 matched none of 2 expectations (3 matchers passed, 2 failed)"
  [[nodiscard]] std::string summary() const;
};

}  // namespace decoy
