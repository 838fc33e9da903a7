#include "task_lifecycle.hpp"

#include <algorithm>
#include <numeric>

#include "internal/util/errors.hpp"

namespace reel::core {

using model::TaskStatus;

std::uint32_t StageWeights::Total() const {
  return std::accumulate(values.begin(), values.end(), std::uint32_t{0});
}

TaskLifecycle::TaskLifecycle(StageWeights weights) : weights_(weights) {
  if (!weights_.Valid()) {
    throw util::InvalidArgument("stage weights must sum to 100, got " + std::to_string(weights_.Total()));
  }
}

void TaskLifecycle::EnterStage(model::GenerationTask& task, TaskStatus stage) const {
  if (!model::IsStage(stage) || !model::CanTransition(task.status, stage)) {
    throw util::InvalidState("illegal transition " + std::string(model::ToString(task.status)) + " -> " + std::string(model::ToString(stage)));
  }
  if (model::IsStage(task.status) && task.stage_progress[model::StageIndex(task.status)] != 100) {
    throw util::InvalidState("stage " + std::string(model::ToString(task.status)) + " has not reached 100%");
  }

  task.status                                   = stage;
  task.stage                                    = stage;
  task.stage_progress[model::StageIndex(stage)] = 0;
  task.message.reset();
}

void TaskLifecycle::ReportStageProgress(model::GenerationTask& task, int percent) const {
  if (!model::IsStage(task.status)) {
    throw util::InvalidState("no active stage in status " + std::string(model::ToString(task.status)));
  }
  auto& current = task.stage_progress[model::StageIndex(task.status)];
  current       = std::max(current, std::clamp(percent, 0, 100));
}

void TaskLifecycle::Complete(model::GenerationTask& task, reel::orchestrator::v1::TaskResult result) const {
  if (!model::CanTransition(task.status, TaskStatus::kCompleted)) {
    throw util::InvalidState("cannot complete task in status " + std::string(model::ToString(task.status)));
  }
  if (task.stage_progress[model::StageIndex(TaskStatus::kAssemblingVideo)] != 100) {
    throw util::InvalidState("final stage has not reached 100%");
  }
  task.status = TaskStatus::kCompleted;
  task.result = std::move(result);
  task.message.reset();
}

void TaskLifecycle::Fail(model::GenerationTask& task, const std::string& kind, const std::string& message) const {
  if (!model::CanTransition(task.status, TaskStatus::kFailed)) {
    throw util::InvalidState("cannot fail task in status " + std::string(model::ToString(task.status)));
  }
  reel::orchestrator::v1::TaskError error;
  error.set_stage(std::string(model::ToString(task.stage)));
  error.set_kind(kind);
  error.set_message(message);

  task.status  = TaskStatus::kFailed;
  task.error   = std::move(error);
  task.message = message;
}

void TaskLifecycle::Cancel(model::GenerationTask& task) const {
  if (!model::CanTransition(task.status, TaskStatus::kCancelled)) {
    throw util::InvalidState("cannot cancel task in status " + std::string(model::ToString(task.status)));
  }
  task.status  = TaskStatus::kCancelled;
  task.message = "cancelled by request";
}

int TaskLifecycle::OverallProgress(const model::GenerationTask& task) const {
  if (task.status == TaskStatus::kCompleted) {
    return 100;
  }
  std::uint32_t weighted = 0;
  for (std::size_t i = 0; i < model::kStageCount; ++i) {
    weighted += weights_.values[i] * static_cast<std::uint32_t>(task.stage_progress[i]);
  }
  return static_cast<int>(weighted / 100);
}

} // namespace reel::core
