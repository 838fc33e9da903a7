#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/state_machine.hpp"
#include "internal/util/time.hpp"
#include "reel/orchestrator/v1/types.pb.h"

namespace reel::model {

/*
  Authoritative in-process task state.

  stage is the last pipeline stage entered (kPending until the first one).
  It stays put when the task reaches a terminal status so a failed task
  still reports where it stopped. Every stage up to and including stage has
  an entry in stage_progress.
*/
struct GenerationTask {
  std::string id;
  std::string owner_id;
  std::string prompt;

  reel::orchestrator::v1::TaskConfig config;

  TaskStatus status = TaskStatus::kPending;
  TaskStatus stage  = TaskStatus::kPending;

  std::array<int, kStageCount> stage_progress{};

  std::optional<std::string>                       message;
  std::optional<reel::orchestrator::v1::TaskError>  error;
  std::optional<reel::orchestrator::v1::TaskResult> result;

  util::TimePoint created_at{};
  util::TimePoint updated_at{};

  // Bumped on every persisted mutation.
  std::uint64_t sequence = 0;

  bool IsTerminal() const {
    return model::IsTerminal(status);
  }

  // Number of pipeline stages entered so far.
  std::size_t EnteredStages() const {
    return IsStage(stage) ? StageIndex(stage) + 1 : 0;
  }
};

} // namespace reel::model
