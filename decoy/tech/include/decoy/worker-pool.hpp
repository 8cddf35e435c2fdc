#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>

#include "decoy/vector.hpp"

namespace decoy {

// Fixed size pool of std::jthread workers consuming a FIFO task queue.
// A pool of a single thread executes its tasks serially, in posting order, and can be used as a strand.
// Exceptions deriving from std::exception thrown by posted tasks are logged and do not stop the worker.
class WorkerPool {
 public:
  using Task = std::move_only_function<void()>;

  explicit WorkerPool(std::size_t nbThreads);

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

  // Stops the pool after having executed all queued tasks.
  ~WorkerPool();

  // Enqueues a task. Returns false if the pool is stopped, in which case the task is dropped.
  bool post(Task task);

  // Enqueues a callable and returns a future of its result. The future holds any exception thrown by the callable.
  // If the pool is stopped, the returned future holds a std::future_error (broken_promise).
  template <class Func>
  auto submit(Func&& func) -> std::future<std::invoke_result_t<std::decay_t<Func>>> {
    using Result = std::invoke_result_t<std::decay_t<Func>>;
    std::packaged_task<Result()> packagedTask(std::forward<Func>(func));
    auto fut = packagedTask.get_future();
    post([pt = std::move(packagedTask)]() mutable { pt(); });
    return fut;
  }

  // Blocks until the queue is empty and no task is running.
  void waitIdle();

  // Refuses new tasks, executes already queued ones then joins the workers. Idempotent.
  void stop() noexcept;

  [[nodiscard]] std::size_t nbThreads() const noexcept { return _threads.size(); }

  [[nodiscard]] bool isStopped() const;

 private:
  void run();

  mutable std::mutex _mutex;
  std::condition_variable _cv;
  std::condition_variable _idleCv;
  std::deque<Task> _tasks;
  std::size_t _nbRunning{0};
  bool _stopped{false};
  vector<std::jthread> _threads;
};

}  // namespace decoy
