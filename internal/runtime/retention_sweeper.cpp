#include "retention_sweeper.hpp"

#include <cstdint>
#include <exception>

#include "internal/core/task_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/progress/progress_bus.hpp"

namespace reel::runtime {

RetentionSweeper::RetentionSweeper(std::shared_ptr<core::TaskStore> store, std::shared_ptr<progress::ProgressBus> bus,
                                   RetentionOptions options)
    : store_(std::move(store)), bus_(std::move(bus)), options_(options) {
}

RetentionSweeper::~RetentionSweeper() {
  Stop();
}

void RetentionSweeper::Start() {
  std::lock_guard lock(mutex_);
  if (running_) return;
  running_ = true;
  thread_  = std::thread(&RetentionSweeper::Loop, this);
}

void RetentionSweeper::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

RetentionSweeper::SweepResult RetentionSweeper::SweepOnce() {
  SweepResult result;
  result.tasks_purged         = store_->PurgeTerminalOlderThan(options_.max_task_age).size();
  result.subscriptions_closed = bus_->SweepIdle(options_.idle_subscription_timeout);

  if (result.tasks_purged > 0 || result.subscriptions_closed > 0) {
    REEL_LOG_INFO("retention sweep", {reel::observability::IntField("tasks_purged", static_cast<std::int64_t>(result.tasks_purged)),
                                      reel::observability::IntField("subscriptions_closed",
                                                                    static_cast<std::int64_t>(result.subscriptions_closed))});
  }
  return result;
}

void RetentionSweeper::Loop() {
  std::unique_lock lock(mutex_);
  while (running_) {
    cv_.wait_for(lock, options_.sweep_interval, [&] { return !running_; });
    if (!running_) break;

    lock.unlock();
    try {
      SweepOnce();
    } catch (const std::exception& e) {
      REEL_LOG_ERROR("retention sweep failed", {reel::observability::StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace reel::runtime
