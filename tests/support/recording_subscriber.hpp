#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <vector>

#include "internal/progress/progress_bus.hpp"

namespace reel::testing {

class RecordingSubscriber final : public progress::Subscriber {
 public:
  bool Deliver(const orchestrator::v1::ProgressEvent& event) override {
    {
      std::lock_guard lock(mutex_);
      if (closed_) return false;
      events_.push_back(event);
    }
    cv_.notify_all();
    return true;
  }

  void Close() {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }

  std::vector<orchestrator::v1::ProgressEvent> Events() const {
    std::lock_guard lock(mutex_);
    return events_;
  }

  // Waits until pred holds for the recorded events.
  bool WaitFor(const std::function<bool(const std::vector<orchestrator::v1::ProgressEvent>&)>& pred,
               std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return pred(events_); });
  }

 private:
  mutable std::mutex                           mutex_;
  std::condition_variable                      cv_;
  std::vector<orchestrator::v1::ProgressEvent> events_;
  bool                                         closed_ = false;
};

} // namespace reel::testing
