#pragma once

#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/util/cancellation.hpp"

namespace reel::runner {

/*
  Cancellation tokens of tasks that are queued or running, keyed by task id.
*/
class CancellationRegistry {
 public:
  // Returns the existing token if the task is already registered.
  util::CancellationTokenPtr Register(const std::string& task_id);

  // nullptr if the task is not registered.
  util::CancellationTokenPtr Find(const std::string& task_id) const;

  // Returns false if the task has no registered token.
  bool Cancel(const std::string& task_id);

  void Remove(const std::string& task_id);

  std::size_t Size() const;

 private:
  mutable std::mutex                                          mutex_;
  std::unordered_map<std::string, util::CancellationTokenPtr> tokens_;
};

} // namespace reel::runner
