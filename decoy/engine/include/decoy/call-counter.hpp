#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>

namespace decoy {

// Signals call counter changes to the threads blocked in a verification.
// Each notification bumps a generation number so that a waiter never misses a change happening between its check
// and its wait.
class CallNotifier {
 public:
  void notify();

  [[nodiscard]] uint64_t generation() const;

  // Blocks until the generation differs from 'seenGeneration' or until 'maxWait' elapsed.
  // Returns the current generation.
  uint64_t waitChange(uint64_t seenGeneration, std::chrono::steady_clock::duration maxWait);

 private:
  mutable std::mutex _mutex;
  std::condition_variable _cv;
  uint64_t _generation{0};
};

// Monotonic, thread safe call counter.
class CallCounter {
 public:
  CallCounter() noexcept = default;

  explicit CallCounter(std::shared_ptr<CallNotifier> notifier) noexcept : _notifier(std::move(notifier)) {}

  CallCounter(const CallCounter&) = delete;
  CallCounter(CallCounter&&) = delete;
  CallCounter& operator=(const CallCounter&) = delete;
  CallCounter& operator=(CallCounter&&) = delete;

  ~CallCounter() = default;

  // Increments the counter in a single atomic step and returns its new value, which is the 1-based index of this
  // call among all calls counted so far.
  uint64_t increment();

  [[nodiscard]] uint64_t value() const noexcept { return _count.load(std::memory_order_acquire); }

  void setNotifier(std::shared_ptr<CallNotifier> notifier) noexcept { _notifier = std::move(notifier); }

 private:
  std::atomic<uint64_t> _count{0};
  std::shared_ptr<CallNotifier> _notifier;
};

}  // namespace decoy
