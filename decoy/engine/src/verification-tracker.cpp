#include "decoy/verification-tracker.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

#include "decoy/call-count.hpp"
#include "decoy/expectation-store.hpp"
#include "decoy/expectation.hpp"
#include "decoy/log.hpp"
#include "decoy/timedef.hpp"

namespace decoy {

namespace {

// Point in time 'timeout' after now, saturated to SteadyTimePoint::max().
SteadyTimePoint DeadlineAfter(Duration timeout) {
  const SteadyTimePoint now = SteadyClock::now();
  if (timeout <= Duration::zero()) {
    return now;
  }
  if (timeout >= std::chrono::duration_cast<Duration>(SteadyTimePoint::max() - now)) {
    return SteadyTimePoint::max();
  }
  return now + timeout;
}

}  // namespace

bool VerificationReport::satisfied() const noexcept {
  return std::ranges::all_of(entries, [](const VerificationEntry& entry) { return entry.satisfied; });
}

std::size_t VerificationReport::nbUnsatisfied() const noexcept {
  return static_cast<std::size_t>(
      std::ranges::count_if(entries, [](const VerificationEntry& entry) { return !entry.satisfied; }));
}

std::string VerificationReport::summary() const {
  std::string ret;
  for (const auto& entry : entries) {
    if (entry.satisfied) {
      continue;
    }
    if (!ret.empty()) {
      ret.push_back('\n');
    }
    ret.append(fmt::format("{} ({}) expected {} but was called {} time{}", entry.subject, entry.description,
                           entry.constraint, entry.actual, entry.actual == 1 ? "" : "s"));
  }
  return ret;
}

VerificationTracker::VerificationTracker(const ExpectationStore& store, Duration pollInterval)
    : _store(&store), _pollInterval(pollInterval) {
  if (_pollInterval <= Duration::zero()) {
    throw std::invalid_argument("verification poll interval should be strictly positive");
  }
}

void VerificationTracker::addCollector(Collector collector) {
  if (!collector) {
    throw std::invalid_argument("empty verification collector");
  }
  _collectors.push_back(std::move(collector));
}

bool VerificationTracker::Test(const CallCount& callCount, uint64_t actual) noexcept {
  try {
    return callCount.test(actual);
  } catch (const std::exception& ex) {
    log::debug("Call count predicate '{}' threw: {}", callCount.describe(), ex.what());
    return false;
  }
}

VerificationReport VerificationTracker::report() const {
  VerificationReport ret;
  const auto snapshot = _store->snapshot();
  ret.entries.reserve(snapshot->expectations.size());
  for (const auto& expectation : snapshot->expectations) {
    // read the counter once so that 'actual' and 'satisfied' are consistent
    const uint64_t actual = expectation->nbCalls();
    auto& entry = ret.entries.emplace_back();
    entry.subject = fmt::format("expectation {}", expectation->index());
    entry.description = expectation->describe();
    entry.constraint = expectation->callCount().describe();
    entry.actual = actual;
    entry.satisfied = Test(expectation->callCount(), actual);
  }
  for (const auto& collector : _collectors) {
    collector(ret);
  }
  return ret;
}

bool VerificationTracker::verify() const {
  const auto snapshot = _store->snapshot();
  const bool expectationsSatisfied = std::ranges::all_of(snapshot->expectations, [](const auto& expectation) {
    return Test(expectation->callCount(), expectation->nbCalls());
  });
  if (!expectationsSatisfied) {
    return false;
  }
  if (_collectors.empty()) {
    return true;
  }
  VerificationReport extra;
  for (const auto& collector : _collectors) {
    collector(extra);
  }
  return extra.satisfied();
}

bool VerificationTracker::verify(Duration timeout) const {
  const SteadyTimePoint deadline = DeadlineAfter(timeout);
  const bool waitForever = deadline == SteadyTimePoint::max();
  CallNotifier& notifier = *_store->notifier();
  while (true) {
    // read the generation before checking so that a change happening in between is not missed
    const uint64_t generation = notifier.generation();
    if (verify()) {
      return true;
    }
    const SteadyTimePoint now = SteadyClock::now();
    if (!waitForever && now >= deadline) {
      break;
    }
    SteadyClock::duration maxWait = _pollInterval;
    if (!waitForever) {
      maxWait = std::min(maxWait, deadline - now);
    }
    notifier.waitChange(generation, maxWait);
  }
  log::info("Verification failed after {} ms: {}", timeout.count(), report().summary());
  return false;
}

}  // namespace decoy
