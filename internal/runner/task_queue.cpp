#include "task_queue.hpp"

namespace reel::runner {

bool TaskQueue::Enqueue(QueuedTask task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return false;
    queue_.push(std::move(task));
  }
  cv_.notify_one();
  return true;
}

std::optional<QueuedTask> TaskQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  QueuedTask task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void TaskQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t TaskQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace reel::runner
