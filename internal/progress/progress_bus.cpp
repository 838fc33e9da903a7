#include "progress_bus.hpp"

#include <algorithm>
#include <functional>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace reel::progress {

namespace {

std::int64_t NowMs() {
  return static_cast<std::int64_t>(util::ToUnixMillis(util::Now()));
}

} // namespace

// ------------------------------------------------------------------
// Subscription
// ------------------------------------------------------------------

Subscription::Subscription(std::weak_ptr<ProgressBus> bus, std::uint64_t id) : bus_(std::move(bus)), id_(id) {
}

Subscription::~Subscription() {
  Reset();
}

Subscription::Subscription(Subscription&& other) noexcept : bus_(std::move(other.bus_)), id_(other.id_) {
  other.id_ = 0;
}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
  if (this != &other) {
    Reset();
    bus_      = std::move(other.bus_);
    id_       = other.id_;
    other.id_ = 0;
  }
  return *this;
}

void Subscription::Reset() {
  if (id_ == 0) {
    return;
  }
  if (auto bus = bus_.lock()) {
    bus->Unsubscribe(id_);
  }
  bus_.reset();
  id_ = 0;
}

// ------------------------------------------------------------------
// ProgressBus
// ------------------------------------------------------------------

ProgressBus::ProgressBus(std::shared_ptr<StatusSource> source) : source_(std::move(source)) {
}

std::string ProgressBus::ShardKey(Scope scope, const std::string& key) {
  return (scope == Scope::kTask ? "task:" : "user:") + key;
}

ProgressBus::Shard& ProgressBus::ShardFor(const std::string& shard_key) {
  return shards_[std::hash<std::string>{}(shard_key) % kShardCount];
}

Subscription ProgressBus::Register(Scope scope, const std::string& key, std::shared_ptr<Subscriber> subscriber, std::shared_ptr<Entry>& entry) {
  entry                   = std::make_shared<Entry>();
  entry->id               = next_id_.fetch_add(1);
  entry->scope            = scope;
  entry->key              = key;
  entry->subscriber       = std::move(subscriber);
  entry->last_activity_ms = NowMs();

  {
    std::scoped_lock lock(index_mutex_);
    index_[entry->id] = entry;
  }
  const auto shard_key = ShardKey(scope, key);
  {
    auto&            shard = ShardFor(shard_key);
    std::scoped_lock lock(shard.mutex);
    shard.entries[shard_key].push_back(entry);
  }

  (scope == Scope::kTask ? task_subscriptions_ : user_subscriptions_).fetch_add(1);

  REEL_LOG_DEBUG("subscription opened", {observability::IntField("subscription_id", static_cast<std::int64_t>(entry->id)),
                                         observability::StringField(scope == Scope::kTask ? "task_id" : "owner_id", key)});
  return Subscription(weak_from_this(), entry->id);
}

Subscription ProgressBus::SubscribeTask(const std::string& task_id, std::shared_ptr<Subscriber> subscriber) {
  source_->OwnerOf(task_id); // NotFound before anything is registered

  // The snapshot is read after registering so no publish can fall in
  // between; sequence dedup absorbs the overlap.
  std::shared_ptr<Entry> entry;
  auto                   subscription = Register(Scope::kTask, task_id, std::move(subscriber), entry);

  Deliver(entry, source_->GetStatus(task_id));
  return subscription;
}

Subscription ProgressBus::SubscribeUser(const std::string& owner_id, std::shared_ptr<Subscriber> subscriber) {
  std::shared_ptr<Entry> entry;
  auto                   subscription = Register(Scope::kUser, owner_id, std::move(subscriber), entry);

  for (const auto& event : source_->ListOwnerStatuses(owner_id)) {
    Deliver(entry, event);
  }
  return subscription;
}

void ProgressBus::Remove(const std::shared_ptr<Entry>& entry) {
  if (entry->closed.exchange(true)) {
    return;
  }

  {
    std::scoped_lock lock(index_mutex_);
    index_.erase(entry->id);
  }

  const auto shard_key = ShardKey(entry->scope, entry->key);
  {
    auto&            shard = ShardFor(shard_key);
    std::scoped_lock lock(shard.mutex);
    auto             it = shard.entries.find(shard_key);
    if (it != shard.entries.end()) {
      auto& list = it->second;
      list.erase(std::remove(list.begin(), list.end(), entry), list.end());
      if (list.empty()) {
        shard.entries.erase(it);
      }
    }
  }

  (entry->scope == Scope::kTask ? task_subscriptions_ : user_subscriptions_).fetch_sub(1);

  REEL_LOG_DEBUG("subscription closed", {observability::IntField("subscription_id", static_cast<std::int64_t>(entry->id))});
}

void ProgressBus::Unsubscribe(std::uint64_t subscription_id) {
  std::shared_ptr<Entry> entry;
  {
    std::scoped_lock lock(index_mutex_);
    auto             it = index_.find(subscription_id);
    if (it == index_.end()) {
      return;
    }
    entry = it->second;
  }
  Remove(entry);
}

void ProgressBus::Touch(std::uint64_t subscription_id) {
  std::scoped_lock lock(index_mutex_);
  auto             it = index_.find(subscription_id);
  if (it != index_.end()) {
    it->second->last_activity_ms = NowMs();
  }
}

void ProgressBus::Deliver(const std::shared_ptr<Entry>& entry, const orchestrator::v1::ProgressEvent& event) {
  bool open = true;
  {
    std::scoped_lock lock(entry->mutex);
    if (entry->closed) {
      return;
    }

    auto& last = entry->last_sequence[event.task_id()];
    if (event.sequence() <= last) {
      return;
    }

    open = entry->subscriber->Deliver(event);
    if (open) {
      last                    = event.sequence();
      entry->last_activity_ms = NowMs();
      events_delivered_.fetch_add(1);
    } else {
      events_dropped_.fetch_add(1);
    }
  }

  if (!open) {
    Remove(entry);
  }
}

std::vector<std::shared_ptr<ProgressBus::Entry>> ProgressBus::Snapshot(Scope scope, const std::string& key) {
  const auto       shard_key = ShardKey(scope, key);
  auto&            shard     = ShardFor(shard_key);
  std::scoped_lock lock(shard.mutex);
  auto             it = shard.entries.find(shard_key);
  if (it == shard.entries.end()) {
    return {};
  }
  return it->second;
}

void ProgressBus::Publish(const std::string& task_id) {
  const auto event = source_->GetStatus(task_id);
  const auto owner = source_->OwnerOf(task_id);

  for (const auto& entry : Snapshot(Scope::kTask, task_id)) {
    Deliver(entry, event);
  }
  for (const auto& entry : Snapshot(Scope::kUser, owner)) {
    Deliver(entry, event);
  }
}

orchestrator::v1::ProgressEvent ProgressBus::GetStatus(const std::string& task_id) {
  return source_->GetStatus(task_id);
}

std::size_t ProgressBus::SweepIdle(std::chrono::milliseconds idle_timeout) {
  const auto cutoff = NowMs() - idle_timeout.count();

  std::vector<std::shared_ptr<Entry>> idle;
  {
    std::scoped_lock lock(index_mutex_);
    for (const auto& [_, entry] : index_) {
      if (entry->last_activity_ms.load() < cutoff) {
        idle.push_back(entry);
      }
    }
  }

  for (const auto& entry : idle) {
    Remove(entry);
  }
  if (!idle.empty()) {
    REEL_LOG_INFO("idle subscriptions dropped", {observability::IntField("count", static_cast<std::int64_t>(idle.size()))});
  }
  return idle.size();
}

BusStats ProgressBus::Stats() const {
  BusStats stats;
  stats.task_subscriptions = task_subscriptions_.load();
  stats.user_subscriptions = user_subscriptions_.load();
  stats.events_delivered   = events_delivered_.load();
  stats.events_dropped     = events_dropped_.load();
  return stats;
}

} // namespace reel::progress
