#pragma once

#include <string>
#include <vector>

#include "reel/orchestrator/v1/types.pb.h"

namespace reel::progress {

/*
  Single source of truth for "current task state". Both the pull path
  (GetStatus RPC, poll fallback) and the push path (initial snapshot on
  subscribe) read through this interface.
*/
class StatusSource {
 public:
  virtual ~StatusSource() = default;

  // Throws util::NotFound for unknown ids.
  virtual orchestrator::v1::ProgressEvent GetStatus(const std::string& task_id) = 0;

  // Throws util::NotFound for unknown ids.
  virtual std::string OwnerOf(const std::string& task_id) = 0;

  // Current snapshot of every task owned by owner_id, oldest first.
  virtual std::vector<orchestrator::v1::ProgressEvent> ListOwnerStatuses(const std::string& owner_id) = 0;
};

} // namespace reel::progress
