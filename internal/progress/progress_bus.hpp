#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/progress/status_source.hpp"
#include "reel/orchestrator/v1/types.pb.h"

namespace reel::progress {

/*
  Observer channel. Deliver returns false once the channel is closed; the
  bus then drops the subscription. Implementations must not block for long:
  they run on the publishing thread.
*/
class Subscriber {
 public:
  virtual ~Subscriber() = default;

  virtual bool Deliver(const orchestrator::v1::ProgressEvent& event) = 0;
};

class ProgressBus;

/*
  RAII subscription handle. Destroying or resetting it unsubscribes.
*/
class Subscription {
 public:
  Subscription() = default;
  Subscription(std::weak_ptr<ProgressBus> bus, std::uint64_t id);
  ~Subscription();

  Subscription(Subscription&& other) noexcept;
  Subscription& operator=(Subscription&& other) noexcept;

  Subscription(const Subscription&)            = delete;
  Subscription& operator=(const Subscription&) = delete;

  void Reset();

  std::uint64_t Id() const {
    return id_;
  }

  explicit operator bool() const {
    return id_ != 0;
  }

 private:
  std::weak_ptr<ProgressBus> bus_;
  std::uint64_t              id_ = 0;
};

struct BusStats {
  std::size_t   task_subscriptions = 0;
  std::size_t   user_subscriptions = 0;
  std::uint64_t events_delivered   = 0;
  std::uint64_t events_dropped     = 0;
};

/*
  ProgressBus

  Fan-out of task snapshots to subscriptions keyed by task id or owner id.

  Delivery contract:
  - Every subscribe immediately receives the current snapshot (all of the
    owner's tasks for user subscriptions), so a reconnecting observer is
    resynchronized without a separate pull.
  - Per subscription and task, events are delivered in sequence order;
    stale or duplicate snapshots are skipped.
  - Best effort: a subscriber that reports its channel closed is removed,
    nothing is buffered on its behalf.

  Publish reads the snapshot from the StatusSource, the same function the
  pull path uses, so push and pull can never disagree.

  Must be owned by a std::shared_ptr for Subscription handles to work.
*/
class ProgressBus : public std::enable_shared_from_this<ProgressBus> {
 public:
  explicit ProgressBus(std::shared_ptr<StatusSource> source);

  // Throws util::NotFound for unknown task ids.
  Subscription SubscribeTask(const std::string& task_id, std::shared_ptr<Subscriber> subscriber);
  Subscription SubscribeUser(const std::string& owner_id, std::shared_ptr<Subscriber> subscriber);

  void Unsubscribe(std::uint64_t subscription_id);

  // Marks a subscription as active without delivering anything.
  void Touch(std::uint64_t subscription_id);

  // Delivers the task's current snapshot to its task and owner subscribers.
  void Publish(const std::string& task_id);

  orchestrator::v1::ProgressEvent GetStatus(const std::string& task_id);

  // Drops subscriptions with no activity for longer than idle_timeout.
  std::size_t SweepIdle(std::chrono::milliseconds idle_timeout);

  BusStats Stats() const;

 private:
  enum class Scope : std::uint8_t { kTask, kUser };

  struct Entry {
    std::uint64_t               id = 0;
    Scope                       scope{};
    std::string                 key;
    std::shared_ptr<Subscriber> subscriber;

    std::mutex                                     mutex;
    std::atomic<bool>                              closed{false};
    std::unordered_map<std::string, std::uint64_t> last_sequence;

    std::atomic<std::int64_t> last_activity_ms{0};
  };

  struct Shard {
    std::mutex                                                           mutex;
    std::unordered_map<std::string, std::vector<std::shared_ptr<Entry>>> entries;
  };

  static constexpr std::size_t kShardCount = 64;

  static std::string ShardKey(Scope scope, const std::string& key);
  Shard&             ShardFor(const std::string& shard_key);

  Subscription Register(Scope scope, const std::string& key, std::shared_ptr<Subscriber> subscriber, std::shared_ptr<Entry>& entry);
  void         Deliver(const std::shared_ptr<Entry>& entry, const orchestrator::v1::ProgressEvent& event);
  void         Remove(const std::shared_ptr<Entry>& entry);
  std::vector<std::shared_ptr<Entry>> Snapshot(Scope scope, const std::string& key);

  std::shared_ptr<StatusSource> source_;

  std::array<Shard, kShardCount> shards_;

  mutable std::mutex                                        index_mutex_;
  std::unordered_map<std::uint64_t, std::shared_ptr<Entry>> index_;

  std::atomic<std::uint64_t> next_id_{1};
  std::atomic<std::size_t>   task_subscriptions_{0};
  std::atomic<std::size_t>   user_subscriptions_{0};
  std::atomic<std::uint64_t> events_delivered_{0};
  std::atomic<std::uint64_t> events_dropped_{0};
};

} // namespace reel::progress
