#include "internal/progress/snapshot_cache.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

namespace {

using namespace std::chrono_literals;
using reel::orchestrator::v1::ProgressEvent;
using reel::progress::SnapshotCache;

struct ManualClock {
  reel::util::TimePoint now = reel::util::TimePoint{} + 1000h;

  SnapshotCache::NowFn Fn() {
    return [this] { return now; };
  }
};

ProgressEvent Event(const std::string& task_id, const std::string& status, std::uint64_t sequence) {
  ProgressEvent event;
  event.set_task_id(task_id);
  event.set_status(status);
  event.set_sequence(sequence);
  return event;
}

void TestLiveSnapshotExpiresAfterPollInterval() {
  ManualClock   clock;
  SnapshotCache cache(2s, 300s, clock.Fn());

  cache.Store(Event("t1", "generating_images", 4));
  assert(cache.Lookup("t1").has_value());

  clock.now += 1999ms;
  assert(cache.Lookup("t1")->sequence() == 4);

  clock.now += 1ms;
  assert(!cache.Lookup("t1").has_value());
  assert(cache.Size() == 0);
}

void TestTerminalSnapshotKeptForTtl() {
  ManualClock   clock;
  SnapshotCache cache(2s, 300s, clock.Fn());

  cache.Store(Event("t1", "completed", 20));
  clock.now += 299s;
  assert(cache.Lookup("t1")->status() == "completed");

  clock.now += 1s;
  assert(!cache.Lookup("t1").has_value());
}

void TestStaleStoreIsIgnored() {
  ManualClock   clock;
  SnapshotCache cache(2s, 300s, clock.Fn());

  cache.Store(Event("t1", "generating_audio", 9));
  cache.Store(Event("t1", "generating_images", 7));
  assert(cache.Lookup("t1")->sequence() == 9);

  cache.Invalidate("t1");
  cache.Store(Event("t1", "generating_images", 7));
  assert(cache.Lookup("t1")->sequence() == 7);
}

} // namespace

int main() {
  TestLiveSnapshotExpiresAfterPollInterval();
  TestTerminalSnapshotKeptForTtl();
  TestStaleStoreIsIgnored();

  std::cout << "reel_unit_snapshot_cache: pass\n";
  return 0;
}
