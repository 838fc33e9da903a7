#include "call_group.hpp"

namespace reel::providers {

CallGroup::~CallGroup() {
  Shutdown();
}

void CallGroup::Shutdown() {
  std::vector<std::thread> threads;
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
    for (auto& [id, entry] : calls_) {
      if (entry.hook) {
        entry.hook();
      }
      if (entry.thread.joinable()) {
        threads.push_back(std::move(entry.thread));
      }
    }
  }

  for (auto& thread : threads) {
    thread.join();
  }

  std::lock_guard lock(mutex_);
  calls_.clear();
}

std::size_t CallGroup::Size() const {
  std::lock_guard lock(mutex_);
  return calls_.size();
}

void CallGroup::ReapLocked() {
  for (auto it = calls_.begin(); it != calls_.end();) {
    if (it->second.done && it->second.thread.joinable()) {
      it->second.thread.join();
      it = calls_.erase(it);
    } else {
      ++it;
    }
  }
}

void CallGroup::MarkDone(std::uint64_t id) {
  std::lock_guard lock(mutex_);
  if (auto it = calls_.find(id); it != calls_.end()) {
    it->second.done = true;
  }
}

void CallGroup::SetHook(std::uint64_t id, CancelHook hook) {
  std::lock_guard lock(mutex_);
  if (stopping_) {
    hook();
    return;
  }
  if (auto it = calls_.find(id); it != calls_.end()) {
    it->second.hook = std::move(hook);
  }
}

void CallGroup::ClearHook(std::uint64_t id) {
  std::lock_guard lock(mutex_);
  if (auto it = calls_.find(id); it != calls_.end()) {
    it->second.hook = nullptr;
  }
}

} // namespace reel::providers
