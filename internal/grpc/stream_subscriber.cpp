#include "stream_subscriber.hpp"

namespace reel::grpc {

QueueSubscriber::QueueSubscriber(std::size_t max_depth) : max_depth_(max_depth == 0 ? 1 : max_depth) {
}

bool QueueSubscriber::Deliver(const orchestrator::v1::ProgressEvent& event) {
  bool accepted = false;
  {
    std::lock_guard lock(mutex_);
    if (closed_) {
      return false;
    }
    if (queue_.size() >= max_depth_) {
      overflowed_ = true;
      closed_     = true;
    } else {
      queue_.push_back(event);
      accepted = true;
    }
  }
  cv_.notify_all();
  return accepted;
}

std::optional<orchestrator::v1::ProgressEvent> QueueSubscriber::Next(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  cv_.wait_for(lock, timeout, [&] { return !queue_.empty() || closed_; });
  if (queue_.empty()) {
    return std::nullopt;
  }
  auto event = std::move(queue_.front());
  queue_.pop_front();
  return event;
}

void QueueSubscriber::Close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool QueueSubscriber::Overflowed() const {
  std::lock_guard lock(mutex_);
  return overflowed_;
}

} // namespace reel::grpc
