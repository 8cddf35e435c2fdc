#include "decoy/mismatch-report.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cstddef>
#include <string>

namespace decoy {

std::size_t ExpectationMismatch::nbPassed() const noexcept {
  return static_cast<std::size_t>(
      std::ranges::count_if(outcomes, [](const MatcherOutcome& outcome) { return outcome.passed; }));
}

std::size_t MismatchReport::nbPassedMatchers() const noexcept {
  std::size_t ret = 0;
  for (const auto& entry : entries) {
    ret += entry.nbPassed();
  }
  return ret;
}

std::size_t MismatchReport::nbFailedMatchers() const noexcept {
  std::size_t ret = 0;
  for (const auto& entry : entries) {
    ret += entry.nbFailed();
  }
  return ret;
}

std::string MismatchReport::summary() const {
  return fmt::format("{} {} matched none of {} expectation{} ({} matcher{} passed, {} failed)", method, target,
                     entries.size(), entries.size() == 1 ? "" : "s", nbPassedMatchers(),
                     nbPassedMatchers() == 1 ? "" : "s", nbFailedMatchers());
}

}  // namespace decoy
