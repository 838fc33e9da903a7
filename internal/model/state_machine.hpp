#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace reel::model {

/*
  Generation task lifecycle.

    pending -> analyzing_prompt -> generating_scenes -> generating_images
            -> generating_audio -> generating_music -> assembling_video
            -> completed

  failed and cancelled are reachable from every non-terminal state.
*/
enum class TaskStatus : std::uint8_t {
  kPending          = 0,
  kAnalyzingPrompt  = 1,
  kGeneratingScenes = 2,
  kGeneratingImages = 3,
  kGeneratingAudio  = 4,
  kGeneratingMusic  = 5,
  kAssemblingVideo  = 6,
  kCompleted        = 7,
  kFailed           = 8,
  kCancelled        = 9,
};

inline constexpr std::size_t kStageCount = 6;

// Fixed stage order. Index i is the i-th stage of every task.
inline constexpr std::array<TaskStatus, kStageCount> kPipeline = {
    TaskStatus::kAnalyzingPrompt, TaskStatus::kGeneratingScenes, TaskStatus::kGeneratingImages,
    TaskStatus::kGeneratingAudio, TaskStatus::kGeneratingMusic,  TaskStatus::kAssemblingVideo,
};

inline constexpr std::array<std::string_view, 10> kStatusNames = {
    "pending",          "analyzing_prompt", "generating_scenes", "generating_images", "generating_audio",
    "generating_music", "assembling_video", "completed",         "failed",            "cancelled",
};

constexpr bool IsTerminal(TaskStatus status) {
  return status == TaskStatus::kCompleted || status == TaskStatus::kFailed || status == TaskStatus::kCancelled;
}

constexpr bool IsStage(TaskStatus status) {
  return status >= TaskStatus::kAnalyzingPrompt && status <= TaskStatus::kAssemblingVideo;
}

// Position of a stage within kPipeline. Only valid for IsStage().
constexpr std::size_t StageIndex(TaskStatus stage) {
  return static_cast<std::size_t>(stage) - 1;
}

constexpr bool CanTransition(TaskStatus from, TaskStatus to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (to == TaskStatus::kFailed || to == TaskStatus::kCancelled) {
    return true;
  }
  if (from == TaskStatus::kAssemblingVideo) {
    return to == TaskStatus::kCompleted;
  }
  return static_cast<std::uint8_t>(to) == static_cast<std::uint8_t>(from) + 1;
}

constexpr std::string_view ToString(TaskStatus status) {
  return kStatusNames[static_cast<std::size_t>(status)];
}

constexpr std::optional<TaskStatus> ParseTaskStatus(std::string_view name) {
  for (std::size_t i = 0; i < kStatusNames.size(); ++i) {
    if (kStatusNames[i] == name) {
      return static_cast<TaskStatus>(i);
    }
  }
  return std::nullopt;
}

static_assert(CanTransition(TaskStatus::kPending, TaskStatus::kAnalyzingPrompt));
static_assert(!CanTransition(TaskStatus::kAnalyzingPrompt, TaskStatus::kGeneratingImages));
static_assert(CanTransition(TaskStatus::kAssemblingVideo, TaskStatus::kCompleted));
static_assert(!CanTransition(TaskStatus::kCompleted, TaskStatus::kFailed));
static_assert(StageIndex(TaskStatus::kAssemblingVideo) == kStageCount - 1);

} // namespace reel::model
