#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/util/errors.hpp"

namespace reel::providers {

/*
  CallGroup

  Runs provider calls on their own threads and keeps track of them. The
  returned future never blocks on destruction, so a cancelled task can
  abandon a call; the thread itself stays owned by the group. Shutdown()
  fires every registered cancel hook and joins all threads. Calls launched
  after Shutdown() fail with util::Cancelled.

    return calls_.Launch([](CallGroup::Call& call) {
      ::grpc::ClientContext ctx;
      auto hook = call.OnCancel([&ctx] { ctx.TryCancel(); });
      ...
    });
*/
class CallGroup {
 public:
  using CancelHook = std::function<void()>;

  // Keeps a cancel hook registered for its lifetime.
  class CancelRegistration {
   public:
    CancelRegistration(CallGroup* group, std::uint64_t id) : group_(group), id_(id) {
    }
    ~CancelRegistration() {
      group_->ClearHook(id_);
    }

    CancelRegistration(const CancelRegistration&)            = delete;
    CancelRegistration& operator=(const CancelRegistration&) = delete;

   private:
    CallGroup*    group_;
    std::uint64_t id_;
  };

  class Call {
   public:
    Call(CallGroup* group, std::uint64_t id) : group_(group), id_(id) {
    }

    // Runs hook on Shutdown() while the registration is alive, or right away
    // when the group is already shutting down.
    CancelRegistration OnCancel(CancelHook hook) {
      group_->SetHook(id_, std::move(hook));
      return CancelRegistration(group_, id_);
    }

   private:
    CallGroup*    group_;
    std::uint64_t id_;
  };

  CallGroup() = default;
  ~CallGroup();

  CallGroup(const CallGroup&)            = delete;
  CallGroup& operator=(const CallGroup&) = delete;

  template <typename Fn>
  auto Launch(Fn fn) -> std::future<decltype(fn(std::declval<Call&>()))>;

  void Shutdown();

  // Calls whose threads have not been joined yet.
  std::size_t Size() const;

 private:
  struct Entry {
    std::thread thread;
    CancelHook  hook;
    bool        done = false;
  };

  // Joins finished threads. Requires mutex_.
  void ReapLocked();
  void MarkDone(std::uint64_t id);
  void SetHook(std::uint64_t id, CancelHook hook);
  void ClearHook(std::uint64_t id);

  mutable std::mutex                        mutex_;
  std::unordered_map<std::uint64_t, Entry> calls_;
  std::uint64_t                             next_id_  = 0;
  bool                                      stopping_ = false;
};

template <typename Fn>
auto CallGroup::Launch(Fn fn) -> std::future<decltype(fn(std::declval<Call&>()))> {
  using T      = decltype(fn(std::declval<Call&>()));
  auto promise = std::make_shared<std::promise<T>>();
  auto future  = promise->get_future();

  std::lock_guard lock(mutex_);
  if (stopping_) {
    promise->set_exception(std::make_exception_ptr(util::Cancelled("provider calls are shutting down")));
    return future;
  }
  ReapLocked();

  const auto id = next_id_++;
  // The worker blocks in MarkDone() until the entry below holds its thread.
  calls_[id].thread = std::thread([this, id, promise, fn = std::move(fn)]() mutable {
    Call call(this, id);
    try {
      if constexpr (std::is_void_v<T>) {
        fn(call);
        promise->set_value();
      } else {
        promise->set_value(fn(call));
      }
    } catch (...) {
      promise->set_exception(std::current_exception());
    }
    MarkDone(id);
  });
  return future;
}

} // namespace reel::providers
