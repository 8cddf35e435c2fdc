#include "decoy/worker-pool.hpp"

#include <cstddef>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <utility>

#include "decoy/log.hpp"

namespace decoy {

WorkerPool::WorkerPool(std::size_t nbThreads) {
  if (nbThreads == 0) {
    throw std::invalid_argument("WorkerPool needs at least one thread");
  }
  _threads.reserve(nbThreads);
  for (std::size_t threadPos = 0; threadPos < nbThreads; ++threadPos) {
    _threads.emplace_back([this] { run(); });
  }
}

WorkerPool::~WorkerPool() { stop(); }

bool WorkerPool::post(Task task) {
  {
    std::scoped_lock lock(_mutex);
    if (_stopped) {
      return false;
    }
    _tasks.push_back(std::move(task));
  }
  _cv.notify_one();
  return true;
}

void WorkerPool::waitIdle() {
  std::unique_lock lock(_mutex);
  _idleCv.wait(lock, [this] { return _tasks.empty() && _nbRunning == 0; });
}

void WorkerPool::stop() noexcept {
  {
    std::scoped_lock lock(_mutex);
    if (_stopped && _threads.empty()) {
      return;
    }
    _stopped = true;
  }
  _cv.notify_all();
  for (auto& thread : _threads) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  _threads.clear();
}

bool WorkerPool::isStopped() const {
  std::scoped_lock lock(_mutex);
  return _stopped;
}

void WorkerPool::run() {
  while (true) {
    Task task;
    {
      std::unique_lock lock(_mutex);
      _cv.wait(lock, [this] { return _stopped || !_tasks.empty(); });
      if (_tasks.empty()) {
        // stopped and fully drained
        return;
      }
      task = std::move(_tasks.front());
      _tasks.pop_front();
      ++_nbRunning;
    }
    try {
      task();
    } catch (const std::exception& ex) {
      log::error("Uncaught exception in worker task: {}", ex.what());
    }
    {
      std::scoped_lock lock(_mutex);
      --_nbRunning;
      if (_tasks.empty() && _nbRunning == 0) {
        _idleCv.notify_all();
      }
    }
  }
}

}  // namespace decoy
