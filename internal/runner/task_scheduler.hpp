#pragma once

#include <atomic>
#include <cstddef>
#include <thread>
#include <vector>

#include "task_queue.hpp"

namespace reel::runner {

/*
  Bounded pool of task workers.

  At most max_in_flight tasks run at once; further submissions wait in FIFO
  order. Nothing is rejected while the scheduler is running.
*/
class TaskScheduler {
 public:
  explicit TaskScheduler(std::size_t max_in_flight);
  ~TaskScheduler();

  TaskScheduler(const TaskScheduler&)            = delete;
  TaskScheduler& operator=(const TaskScheduler&) = delete;

  void Start();

  // Queued tasks still waiting are run before workers exit.
  void Stop();

  // Throws util::InvalidState once stopped.
  void Submit(QueuedTask task);

  std::size_t Running() const {
    return running_.load();
  }

  std::size_t Queued() const {
    return queue_.Size();
  }

  std::size_t Capacity() const {
    return max_in_flight_;
  }

 private:
  void Run();
  void ReportLoad() const;

  std::size_t              max_in_flight_;
  TaskQueue                queue_;
  std::vector<std::thread> workers_;
  std::atomic<std::size_t> running_{0};
  std::atomic<bool>        started_{false};
};

} // namespace reel::runner
