#pragma once

#include <cstddef>
#include <memory>
#include <shared_mutex>

#include "decoy/call-counter.hpp"
#include "decoy/expectation.hpp"
#include "decoy/vector.hpp"

namespace decoy {

// Immutable view of the registered expectations and requirements, in registration order.
struct ExpectationSnapshot {
  vector<std::shared_ptr<const Expectation>> expectations;
  vector<std::shared_ptr<const Requirement>> requirements;
};

// Ordered, append-only collection of the expectations and requirements of one server.
// Registration publishes a new snapshot (copy on write): readers take the current snapshot once per request and
// never block writers for longer than a pointer copy.
class ExpectationStore {
 public:
  explicit ExpectationStore(std::shared_ptr<CallNotifier> notifier = std::make_shared<CallNotifier>());

  // Appends 'expectations' atomically, in order, assigning them their registration index.
  void add(vector<std::shared_ptr<Expectation>> expectations);

  void addRequirements(vector<std::shared_ptr<const Requirement>> requirements);

  [[nodiscard]] std::shared_ptr<const ExpectationSnapshot> snapshot() const;

  // Removes all expectations and requirements. Their counters go away with them.
  void clear();

  [[nodiscard]] std::size_t size() const;

  [[nodiscard]] const std::shared_ptr<CallNotifier>& notifier() const noexcept { return _notifier; }

 private:
  mutable std::shared_mutex _mutex;
  std::shared_ptr<const ExpectationSnapshot> _snapshot;
  std::shared_ptr<CallNotifier> _notifier;
};

}  // namespace decoy
