#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include "decoy/call-count.hpp"
#include "decoy/expectation-store.hpp"
#include "decoy/timedef.hpp"
#include "decoy/vector.hpp"

namespace decoy {

struct VerificationEntry {
  // 'expectation 3', 'websocket expectation 1'...
  std::string subject;
  std::string description;
  std::string constraint;
  uint64_t actual{};
  bool satisfied{};
};

struct VerificationReport {
  vector<VerificationEntry> entries;

  [[nodiscard]] bool satisfied() const noexcept;

  [[nodiscard]] std::size_t nbUnsatisfied() const noexcept;

  // One line per unsatisfied entry, empty if all constraints are satisfied.
  [[nodiscard]] std::string summary() const;
};

// Checks the call count constraints of all registered expectations against their counters.
// Verification is read only: counters are never reset by it.
class VerificationTracker {
 public:
  // Appends the entries of additional counted rules (WebSocket expectations) to a report.
  using Collector = std::function<void(VerificationReport&)>;

  // Disables the deadline of verify(timeout).
  static constexpr Duration kWaitForever = Duration::max();

  explicit VerificationTracker(const ExpectationStore& store, Duration pollInterval = std::chrono::milliseconds(50));

  // Registers an additional source of constraints. Not thread safe, to be called at configuration time.
  void addCollector(Collector collector);

  // Immediate check.
  [[nodiscard]] bool verify() const;

  // Waits until all constraints are satisfied or until 'timeout' elapsed, re-checking on each counter change and at
  // least every poll interval.
  [[nodiscard]] bool verify(Duration timeout) const;

  [[nodiscard]] VerificationReport report() const;

  // Evaluates 'callCount' against 'actual'. A throwing predicate counts as unsatisfied.
  [[nodiscard]] static bool Test(const CallCount& callCount, uint64_t actual) noexcept;

 private:
  const ExpectationStore* _store;
  vector<Collector> _collectors;
  Duration _pollInterval;
};

}  // namespace decoy
