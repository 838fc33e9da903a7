#include "snapshot_cache.hpp"

#include "internal/progress/progress_event.hpp"

namespace reel::progress {

SnapshotCache::SnapshotCache(std::chrono::milliseconds poll_interval, std::chrono::milliseconds terminal_ttl, NowFn now)
    : poll_interval_(poll_interval), terminal_ttl_(terminal_ttl), now_(std::move(now)) {
}

std::optional<orchestrator::v1::ProgressEvent> SnapshotCache::Lookup(const std::string& task_id) {
  std::scoped_lock lock(mutex_);
  auto             it = items_.find(task_id);
  if (it == items_.end()) {
    return std::nullopt;
  }
  if (now_() >= it->second.expires_at) {
    items_.erase(it);
    return std::nullopt;
  }
  return it->second.event;
}

void SnapshotCache::Store(const orchestrator::v1::ProgressEvent& event) {
  const auto now = now_();

  std::scoped_lock lock(mutex_);
  auto             it = items_.find(event.task_id());
  if (it != items_.end() && now < it->second.expires_at && it->second.event.sequence() > event.sequence()) {
    return;
  }

  const auto ttl         = IsTerminalEvent(event) ? terminal_ttl_ : poll_interval_;
  items_[event.task_id()] = Item{event, now + ttl};
}

void SnapshotCache::Invalidate(const std::string& task_id) {
  std::scoped_lock lock(mutex_);
  items_.erase(task_id);
}

std::size_t SnapshotCache::Size() const {
  std::scoped_lock lock(mutex_);
  return items_.size();
}

} // namespace reel::progress
