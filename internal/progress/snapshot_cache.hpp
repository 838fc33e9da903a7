#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "internal/util/time.hpp"
#include "reel/orchestrator/v1/types.pb.h"

namespace reel::progress {

/*
  Observer-side snapshot cache.

  Terminal snapshots (completed / failed / cancelled) are kept for
  terminal_ttl; they can no longer change. Live snapshots are kept for at
  most poll_interval so a poller never serves state older than one poll.
*/
class SnapshotCache {
 public:
  using NowFn = std::function<util::TimePoint()>;

  SnapshotCache(std::chrono::milliseconds poll_interval, std::chrono::milliseconds terminal_ttl, NowFn now = util::Now);

  std::optional<orchestrator::v1::ProgressEvent> Lookup(const std::string& task_id);

  // Ignored if a fresher snapshot (higher sequence) is already cached.
  void Store(const orchestrator::v1::ProgressEvent& event);

  void        Invalidate(const std::string& task_id);
  std::size_t Size() const;

 private:
  struct Item {
    orchestrator::v1::ProgressEvent event;
    util::TimePoint                 expires_at;
  };

  std::chrono::milliseconds poll_interval_;
  std::chrono::milliseconds terminal_ttl_;
  NowFn                     now_;

  mutable std::mutex                    mutex_;
  std::unordered_map<std::string, Item> items_;
};

} // namespace reel::progress
