#pragma once

#include <string>

#include "internal/model/generation_task.hpp"
#include "reel/orchestrator/v1/types.pb.h"

namespace reel::progress {

// Snapshot of a task as delivered to observers. stage_progress only lists
// stages the task has entered.
orchestrator::v1::ProgressEvent BuildProgressEvent(const model::GenerationTask& task, int overall_progress);

// JSON with proto field names (task_id, stage_progress, ...).
std::string ToJson(const orchestrator::v1::ProgressEvent& event);

bool IsTerminalEvent(const orchestrator::v1::ProgressEvent& event);

} // namespace reel::progress
