#pragma once

#include <array>
#include <cstdint>
#include <string>

#include "internal/model/generation_task.hpp"
#include "internal/model/state_machine.hpp"
#include "reel/orchestrator/v1/types.pb.h"

namespace reel::core {

/*
  Per-stage cost table used for overall progress. Must sum to 100.
*/
struct StageWeights {
  std::array<std::uint32_t, model::kStageCount> values{5, 10, 25, 20, 10, 30};

  std::uint32_t Total() const;
  bool          Valid() const {
    return Total() == 100;
  }
};

/*
  TaskLifecycle

  Applies state machine rules to a GenerationTask value. Callers are
  responsible for persisting and publishing the result; every method either
  leaves the task untouched and throws util::InvalidState, or applies the
  transition completely.
*/
class TaskLifecycle {
 public:
  explicit TaskLifecycle(StageWeights weights = {});

  // Requires the current stage at 100%. Resets the new stage to 0.
  void EnterStage(model::GenerationTask& task, model::TaskStatus stage) const;

  // Clamped to [0,100]. Never lowers the value already recorded.
  void ReportStageProgress(model::GenerationTask& task, int percent) const;

  void Complete(model::GenerationTask& task, reel::orchestrator::v1::TaskResult result) const;
  void Fail(model::GenerationTask& task, const std::string& kind, const std::string& message) const;
  void Cancel(model::GenerationTask& task) const;

  int OverallProgress(const model::GenerationTask& task) const;

 private:
  StageWeights weights_;
};

} // namespace reel::core
