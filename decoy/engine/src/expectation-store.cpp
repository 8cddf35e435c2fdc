#include "decoy/expectation-store.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <utility>

#include "decoy/call-counter.hpp"
#include "decoy/expectation.hpp"
#include "decoy/log.hpp"
#include "decoy/vector.hpp"

namespace decoy {

ExpectationStore::ExpectationStore(std::shared_ptr<CallNotifier> notifier)
    : _snapshot(std::make_shared<const ExpectationSnapshot>()), _notifier(std::move(notifier)) {}

void ExpectationStore::add(vector<std::shared_ptr<Expectation>> expectations) {
  std::unique_lock<std::shared_mutex> lock(_mutex);
  auto next = std::make_shared<ExpectationSnapshot>(*_snapshot);
  next->expectations.reserve(next->expectations.size() + expectations.size());
  for (auto& expectation : expectations) {
    expectation->attach(next->expectations.size() + 1U, _notifier);
    log::debug("Registered expectation {}: {}", expectation->index(), expectation->describe());
    next->expectations.push_back(std::move(expectation));
  }
  _snapshot = std::move(next);
}

void ExpectationStore::addRequirements(vector<std::shared_ptr<const Requirement>> requirements) {
  std::unique_lock<std::shared_mutex> lock(_mutex);
  auto next = std::make_shared<ExpectationSnapshot>(*_snapshot);
  for (auto& requirement : requirements) {
    log::debug("Registered requirement for {}", requirement->describeScope());
    next->requirements.push_back(std::move(requirement));
  }
  _snapshot = std::move(next);
}

std::shared_ptr<const ExpectationSnapshot> ExpectationStore::snapshot() const {
  std::shared_lock<std::shared_mutex> lock(_mutex);
  return _snapshot;
}

void ExpectationStore::clear() {
  std::unique_lock<std::shared_mutex> lock(_mutex);
  _snapshot = std::make_shared<const ExpectationSnapshot>();
  // wake up verifiers so that they re-evaluate against the new, empty set
  _notifier->notify();
}

std::size_t ExpectationStore::size() const { return snapshot()->expectations.size(); }

}  // namespace decoy
