#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "internal/core/task_store.hpp"
#include "internal/media/media_editor.hpp"
#include "internal/model/scene.hpp"
#include "internal/progress/progress_bus.hpp"
#include "internal/providers/generation_providers.hpp"
#include "internal/runner/cancellation_registry.hpp"
#include "internal/runner/retry_policy.hpp"
#include "internal/storage/asset_store.hpp"
#include "internal/timing/duration_adjuster.hpp"
#include "internal/timing/scene_duration_allocator.hpp"
#include "internal/timing/scene_transitions.hpp"
#include "internal/util/cancellation.hpp"

namespace reel::runner {

struct RunnerOptions {
  RetryPolicy               retry;
  std::size_t               scene_concurrency = 3;
  std::chrono::milliseconds task_timeout{std::chrono::hours(1)};
  timing::AllocationOptions allocation;
  double                    music_gain = 0.3;
  // Crossfade between scenes; 0 joins them with hard cuts.
  double transition_s = 0.0;
};

/*
  Per-run state threaded through the stage handlers.
*/
struct RunContext {
  std::string                  task_id;
  std::string                  prompt;
  orchestrator::v1::TaskConfig config;
  std::string                  stage;

  util::CancellationTokenPtr            token;
  std::chrono::steady_clock::time_point deadline;

  orchestrator::v1::PromptAnalysis analysis;
  timing::TransitionPlan           transitions;
  orchestrator::v1::TaskResult     result;
};

/*
  TaskRunner

  Drives one task through the fixed stage pipeline:

    analyzing_prompt   provider prompt analysis
    generating_scenes  scene breakdown + duration allocation
    generating_images  one image per scene
    generating_audio   speech per scene, fitted to the scene's clip length
    generating_music   music per scene, fitted, mixed under the speech
    assembling_video   video per scene, fitted to its audio, muxed,
                       joined (cut or crossfade), fitted to the total,
                       thumbnail

  With crossfades every clip is lengthened by half of each adjacent
  overlap (timing::PlanTransitions) so the joined cut still matches the
  requested total.

  Per-scene work inside a stage runs concurrently up to scene_concurrency.
  Only the stage coordinator (the thread calling Run) writes stage
  progress. Every state change is published on the bus.

  Failures: retryable errors are retried inside the stage; anything else
  fails the task with the stage name and error kind. Partial assets are
  kept. Cancellation is cooperative and checked at every wait.
*/
class TaskRunner {
 public:
  TaskRunner(std::shared_ptr<core::TaskStore> store, std::shared_ptr<progress::ProgressBus> bus,
             providers::GenerationProvidersPtr providers, std::shared_ptr<timing::DurationAdjuster> adjuster,
             std::shared_ptr<media::MediaEditor> editor, storage::AssetStorePtr assets,
             std::shared_ptr<CancellationRegistry> cancellations, RunnerOptions options = {});

  // Runs the task to a terminal state. Never throws for task level errors.
  void Run(const std::string& task_id);

  const RunnerOptions& Options() const {
    return options_;
  }

 private:
  using StageHandler = void (TaskRunner::*)(RunContext&);
  using SceneWork    = std::function<void(const model::Scene&, const RunContext&)>;

  static const std::array<StageHandler, model::kStageCount> kStageHandlers;

  void AnalyzePrompt(RunContext& ctx);
  void GenerateScenes(RunContext& ctx);
  void GenerateImages(RunContext& ctx);
  void GenerateAudio(RunContext& ctx);
  void GenerateMusic(RunContext& ctx);
  void AssembleVideo(RunContext& ctx);

  // Runs work for every scene, at most scene_concurrency at a time, and
  // advances stage progress up to progress_span as scenes complete. The
  // first failure cancels the remaining scenes and is rethrown.
  void ForEachScene(const RunContext& ctx, int progress_span, const SceneWork& work);

  void ReportProgress(const RunContext& ctx, int percent);
  void StoreAsset(const RunContext& ctx, const model::Scene& scene, model::AssetSlot slot, const std::string& ref,
                  std::optional<double> actual_duration = std::nullopt);

  void FinishCancelled(const RunContext& ctx);
  void FinishFailed(const RunContext& ctx, const std::exception& error);
  void Publish(const std::string& task_id);

  std::shared_ptr<core::TaskStore>          store_;
  std::shared_ptr<progress::ProgressBus>    bus_;
  providers::GenerationProvidersPtr         providers_;
  std::shared_ptr<timing::DurationAdjuster> adjuster_;
  std::shared_ptr<media::MediaEditor>       editor_;
  storage::AssetStorePtr                    assets_;
  std::shared_ptr<CancellationRegistry>     cancellations_;
  RunnerOptions                             options_;
};

} // namespace reel::runner
