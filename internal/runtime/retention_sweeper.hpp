#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>

namespace reel::core { class TaskStore; }
namespace reel::progress { class ProgressBus; }

namespace reel::runtime {

struct RetentionOptions {
  std::chrono::milliseconds max_task_age{std::chrono::hours(168)};
  std::chrono::milliseconds sweep_interval{std::chrono::hours(1)};
  std::chrono::milliseconds idle_subscription_timeout{std::chrono::minutes(10)};
};

/*
  Periodically drops terminal tasks past max_task_age and subscriptions
  that have been idle longer than idle_subscription_timeout.
*/
class RetentionSweeper {
 public:
  RetentionSweeper(std::shared_ptr<core::TaskStore> store, std::shared_ptr<progress::ProgressBus> bus, RetentionOptions options);
  ~RetentionSweeper();

  RetentionSweeper(const RetentionSweeper&)            = delete;
  RetentionSweeper& operator=(const RetentionSweeper&) = delete;

  void Start();
  void Stop();

  struct SweepResult {
    std::size_t tasks_purged         = 0;
    std::size_t subscriptions_closed = 0;
  };

  SweepResult SweepOnce();

 private:
  void Loop();

  std::shared_ptr<core::TaskStore>       store_;
  std::shared_ptr<progress::ProgressBus> bus_;
  RetentionOptions                       options_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    running_ = false;
  std::thread             thread_;
};

} // namespace reel::runtime
