#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <string>

namespace reel::runner {

/*
  A unit of work waiting for a scheduler slot.
*/
struct QueuedTask {
  std::string           task_id;
  std::function<void()> run;
};

/*
  Thread-safe blocking FIFO for scheduler workers.
*/
class TaskQueue {
 public:
  // Returns false after Shutdown().
  bool Enqueue(QueuedTask task);

  // blocking wait; nullopt once shut down and drained
  std::optional<QueuedTask> Dequeue();

  void Shutdown();

  std::size_t Size() const;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::queue<QueuedTask>  queue_;
  bool                    shutdown_ = false;
};

} // namespace reel::runner
