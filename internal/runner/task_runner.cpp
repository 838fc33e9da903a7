#include "task_runner.hpp"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <exception>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace reel::runner {

namespace {

using model::AssetSlot;
using model::Scene;
using model::TaskStatus;
using observability::DoubleField;
using observability::IntField;
using observability::StringField;

constexpr std::chrono::milliseconds kAwaitSlice{50};

// Seconds of the assembled video used for the thumbnail frame.
constexpr double kThumbnailOffsetS = 1.0;

void CheckInterrupts(const RunContext& ctx, const std::string& operation) {
  ctx.token->ThrowIfCancelled(operation);
  if (std::chrono::steady_clock::now() >= ctx.deadline) {
    throw util::TaskTimeout(operation + ": task exceeded its time limit");
  }
}

// Waits for a provider result without ever blocking longer than one slice
// between cancellation and deadline checks. An abandoned future is left to
// complete on its own.
template <typename T>
T Await(std::future<T> future, const RunContext& ctx, const std::string& operation) {
  while (future.wait_for(kAwaitSlice) != std::future_status::ready) {
    CheckInterrupts(ctx, operation);
  }
  return future.get();
}

double SceneMinimum(const RunContext& ctx, const timing::AllocationOptions& defaults) {
  return ctx.config.min_scene_duration_s() > 0.0 ? ctx.config.min_scene_duration_s() : defaults.min_scene_duration;
}

} // namespace

const std::array<TaskRunner::StageHandler, model::kStageCount> TaskRunner::kStageHandlers = {
    &TaskRunner::AnalyzePrompt, &TaskRunner::GenerateScenes, &TaskRunner::GenerateImages,
    &TaskRunner::GenerateAudio, &TaskRunner::GenerateMusic,  &TaskRunner::AssembleVideo,
};

TaskRunner::TaskRunner(std::shared_ptr<core::TaskStore> store, std::shared_ptr<progress::ProgressBus> bus,
                       providers::GenerationProvidersPtr providers, std::shared_ptr<timing::DurationAdjuster> adjuster,
                       std::shared_ptr<media::MediaEditor> editor, storage::AssetStorePtr assets,
                       std::shared_ptr<CancellationRegistry> cancellations, RunnerOptions options)
    : store_(std::move(store)),
      bus_(std::move(bus)),
      providers_(std::move(providers)),
      adjuster_(std::move(adjuster)),
      editor_(std::move(editor)),
      assets_(std::move(assets)),
      cancellations_(std::move(cancellations)),
      options_(std::move(options)) {
  if (options_.scene_concurrency == 0) {
    throw util::InvalidArgument("scene_concurrency must be positive");
  }
}

void TaskRunner::Run(const std::string& task_id) {
  const auto task = store_->Get(task_id);

  RunContext ctx;
  ctx.task_id  = task_id;
  ctx.prompt   = task.prompt;
  ctx.config   = task.config;
  ctx.token    = cancellations_->Register(task_id);
  ctx.deadline = std::chrono::steady_clock::now() + options_.task_timeout;

  if (task.IsTerminal()) {
    cancellations_->Remove(task_id);
    return;
  }

  observability::TaskLogScope log_scope(task_id);
  observability::SpanScope     task_span("reel.task.run");
  task_span.SetAttribute("task_id", task_id);

  try {
    for (const auto stage : model::kPipeline) {
      const std::string stage_name(model::ToString(stage));
      ctx.stage = stage_name;
      log_scope.SetStage(stage_name);
      CheckInterrupts(ctx, stage_name);

      if (!store_->Mutate(task_id, [&](model::GenerationTask& t) { store_->Lifecycle().EnterStage(t, stage); })) {
        throw util::Cancelled("task left the live states");
      }
      Publish(task_id);
      REEL_LOG_INFO("stage entered");

      observability::SpanScope span("reel.task.stage");
      span.SetAttribute("task_id", task_id);
      span.SetAttribute("stage", stage_name);

      const auto started = std::chrono::steady_clock::now();
      (this->*kStageHandlers[model::StageIndex(stage)])(ctx);
      ReportProgress(ctx, 100);

      const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
      observability::Metrics::Instance().ObserveStageDurationMs(stage_name, elapsed);
    }

    if (!store_->Mutate(task_id, [&](model::GenerationTask& t) { store_->Lifecycle().Complete(t, ctx.result); })) {
      throw util::Cancelled("task left the live states");
    }
    Publish(task_id);
    observability::Metrics::Instance().RecordTaskOutcome("completed");
    log_scope.SetStage({});
    REEL_LOG_INFO("task completed",
                  {StringField("video_ref", ctx.result.video_ref()), DoubleField("duration_s", ctx.result.duration_s())});
  } catch (const util::Cancelled&) {
    FinishCancelled(ctx);
  } catch (const std::exception& e) {
    task_span.RecordException(e.what());
    if (ctx.token->IsCancelled()) {
      FinishCancelled(ctx);
    } else {
      FinishFailed(ctx, e);
    }
  }

  cancellations_->Remove(task_id);
}

// ------------------------------------------------------------------
// Stage handlers
// ------------------------------------------------------------------

void TaskRunner::AnalyzePrompt(RunContext& ctx) {
  ctx.analysis = WithRetry(options_.retry, *ctx.token, ctx.deadline, "analyze_prompt", [&] {
    return Await(providers_->AnalyzePrompt(ctx.prompt, ctx.config), ctx, "analyze_prompt");
  });
}

void TaskRunner::GenerateScenes(RunContext& ctx) {
  const auto drafts = WithRetry(options_.retry, *ctx.token, ctx.deadline, "breakdown_scenes", [&] {
    return Await(providers_->BreakdownScenes(ctx.prompt, ctx.analysis, ctx.config), ctx, "breakdown_scenes");
  });
  if (drafts.empty()) {
    throw util::ProviderPermanent("scene breakdown returned no scenes");
  }
  ReportProgress(ctx, 50);

  std::vector<Scene> scenes;
  scenes.reserve(drafts.size());
  for (std::size_t i = 0; i < drafts.size(); ++i) {
    const auto& draft = drafts[i];
    Scene       scene;
    scene.index         = static_cast<std::uint32_t>(i);
    scene.title         = draft.title();
    scene.script_text   = draft.script_text();
    scene.visual_prompt = draft.visual_prompt();
    scene.audio_prompt  = draft.audio_prompt();
    scene.music_prompt  = draft.music_prompt();
    scene.weight        = draft.has_weight() ? draft.weight() : 1.0;
    scenes.push_back(std::move(scene));
  }

  auto allocation               = options_.allocation;
  allocation.min_scene_duration = SceneMinimum(ctx, options_.allocation);
  timing::SceneDurationAllocator(allocation).Apply(scenes, ctx.config.total_duration_s());

  std::vector<double> targets;
  targets.reserve(scenes.size());
  for (const auto& scene : scenes) {
    targets.push_back(scene.target_duration);
  }
  ctx.transitions = timing::PlanTransitions(targets, options_.transition_s);

  store_->SetScenes(ctx.task_id, std::move(scenes));
  REEL_LOG_INFO("scenes allocated", {StringField("task_id", ctx.task_id), IntField("scenes", static_cast<std::int64_t>(drafts.size()))});
}

void TaskRunner::GenerateImages(RunContext& ctx) {
  ForEachScene(ctx, 100, [this](const Scene& scene, const RunContext& sctx) {
    const auto ref = WithRetry(options_.retry, *sctx.token, sctx.deadline, "generate_image", [&] {
      return Await(providers_->GenerateImage(scene.visual_prompt, sctx.config), sctx, "generate_image");
    });
    StoreAsset(sctx, scene, AssetSlot::kImage, ref);
  });
}

void TaskRunner::GenerateAudio(RunContext& ctx) {
  ForEachScene(ctx, 100, [this](const Scene& scene, const RunContext& sctx) {
    const auto speech = WithRetry(options_.retry, *sctx.token, sctx.deadline, "synthesize_speech", [&] {
      return Await(providers_->SynthesizeSpeech(scene.script_text, scene.audio_prompt), sctx, "synthesize_speech");
    });
    const double clip   = sctx.transitions.clips.at(scene.index);
    const auto   fitted = adjuster_->Adjust(speech, clip, timing::AdjustOptions{}, sctx.token.get(), sctx.deadline);
    StoreAsset(sctx, scene, AssetSlot::kSpeech, fitted.ref, fitted.duration);
  });
}

void TaskRunner::GenerateMusic(RunContext& ctx) {
  ForEachScene(ctx, 100, [this](const Scene& scene, const RunContext& sctx) {
    const double clip  = sctx.transitions.clips.at(scene.index);
    const auto   music = WithRetry(options_.retry, *sctx.token, sctx.deadline, "synthesize_music", [&] {
      return Await(providers_->SynthesizeMusic(scene.music_prompt, clip), sctx, "synthesize_music");
    });

    timing::AdjustOptions music_options;
    music_options.fade_in  = true;
    music_options.fade_out = true;
    const auto fitted      = adjuster_->Adjust(music, clip, music_options, sctx.token.get(), sctx.deadline);
    StoreAsset(sctx, scene, AssetSlot::kMusic, fitted.ref);

    sctx.token->ThrowIfCancelled("mix_audio");
    const auto mixed = assets_->ReserveSibling(scene.Asset(AssetSlot::kSpeech));
    editor_->MixAudio(scene.Asset(AssetSlot::kSpeech), fitted.ref, options_.music_gain, mixed);

    const auto mixed_fitted = adjuster_->Adjust(mixed, clip, timing::AdjustOptions{}, sctx.token.get(), sctx.deadline);
    StoreAsset(sctx, scene, AssetSlot::kMixedAudio, mixed_fitted.ref, mixed_fitted.duration);
  });
}

void TaskRunner::AssembleVideo(RunContext& ctx) {
  ForEachScene(ctx, 80, [this](const Scene& scene, const RunContext& sctx) {
    const double clip_target = sctx.transitions.clips.at(scene.index);
    const auto   clip        = WithRetry(options_.retry, *sctx.token, sctx.deadline, "generate_video", [&] {
      return Await(providers_->GenerateVideo(scene.Asset(AssetSlot::kImage), scene.visual_prompt, clip_target, sctx.config), sctx,
                   "generate_video");
    });

    // The clip follows its audio track, which already matches the clip length.
    const double audio_duration = scene.actual_duration > 0.0 ? scene.actual_duration : clip_target;
    const auto   fitted         = adjuster_->Adjust(clip, audio_duration, timing::AdjustOptions{}, sctx.token.get(), sctx.deadline);
    StoreAsset(sctx, scene, AssetSlot::kVideo, fitted.ref);

    sctx.token->ThrowIfCancelled("mux");
    const auto muxed = assets_->ReserveSibling(fitted.ref);
    editor_->Mux(fitted.ref, scene.Asset(AssetSlot::kMixedAudio), muxed);
    StoreAsset(sctx, scene, AssetSlot::kFinalScene, muxed);
  });

  std::vector<std::string> parts;
  for (const auto& scene : store_->Scenes(ctx.task_id)) {
    parts.push_back(scene.Asset(AssetSlot::kFinalScene));
  }

  CheckInterrupts(ctx, "concat");
  const auto joined = assets_->ReserveSibling(parts.front());
  if (timing::HasOverlap(ctx.transitions.overlaps)) {
    editor_->CrossfadeConcat(parts, ctx.transitions.clips, ctx.transitions.overlaps, joined);
  } else {
    editor_->Concat(parts, joined);
  }
  ReportProgress(ctx, 90);

  timing::AdjustOptions final_options;
  final_options.fade_out = true;
  const auto final_cut   = adjuster_->Adjust(joined, ctx.config.total_duration_s(), final_options, ctx.token.get(), ctx.deadline);

  CheckInterrupts(ctx, "thumbnail");
  const auto thumbnail = assets_->Reserve("jpg");
  editor_->ExtractThumbnail(final_cut.ref, std::min(kThumbnailOffsetS, final_cut.duration / 2.0), thumbnail);

  ctx.result.set_video_ref(final_cut.ref);
  ctx.result.set_thumbnail_ref(thumbnail);
  ctx.result.set_duration_s(final_cut.duration);
}

// ------------------------------------------------------------------
// Scene fan-out
// ------------------------------------------------------------------

void TaskRunner::ForEachScene(const RunContext& ctx, int progress_span, const SceneWork& work) {
  const auto scenes = store_->Scenes(ctx.task_id);
  if (scenes.empty()) {
    throw util::InvalidState("task " + ctx.task_id + " has no scenes");
  }

  struct Completion {
    std::uint32_t      index = 0;
    std::exception_ptr error;
  };

  RunContext scene_ctx = ctx;
  auto       child     = std::make_shared<util::CancellationToken>(ctx.token);
  scene_ctx.token      = child;

  std::mutex             mutex;
  std::condition_variable cv;
  std::deque<Completion>  done;

  // Joins workers on every exit path; remaining workers are told to stop first.
  struct Workers {
    util::CancellationToken& token;
    std::vector<std::thread> threads;
    ~Workers() {
      token.Cancel();
      for (auto& t : threads) {
        if (t.joinable()) t.join();
      }
    }
  } workers{*child, {}};

  const std::size_t total     = scenes.size();
  std::size_t       next      = 0;
  std::size_t       running   = 0;
  std::size_t       completed = 0;
  std::exception_ptr failure;

  while (running > 0 || (!failure && next < total)) {
    while (!failure && running < options_.scene_concurrency && next < total) {
      const Scene scene = scenes[next++];
      ++running;
      workers.threads.emplace_back([&, scene] {
        observability::TaskLogScope log_scope(scene_ctx.task_id, scene_ctx.stage, scene.index);
        Completion                  completion{scene.index, nullptr};
        try {
          work(scene, scene_ctx);
        } catch (...) {
          completion.error = std::current_exception();
        }
        {
          std::scoped_lock lock(mutex);
          done.push_back(std::move(completion));
        }
        cv.notify_one();
      });
    }

    std::deque<Completion> finished;
    {
      std::unique_lock lock(mutex);
      cv.wait_for(lock, kAwaitSlice, [&] { return !done.empty(); });
      finished.swap(done);
    }

    if (!failure) {
      if (ctx.token->IsCancelled()) {
        failure = std::make_exception_ptr(util::Cancelled("cancelled during scene work"));
      } else if (std::chrono::steady_clock::now() >= ctx.deadline) {
        failure = std::make_exception_ptr(util::TaskTimeout("task exceeded its time limit"));
      }
      if (failure) child->Cancel();
    }

    bool advanced = false;
    for (auto& completion : finished) {
      --running;
      if (completion.error) {
        if (!failure) {
          failure = completion.error;
          child->Cancel();
        }
        continue;
      }
      ++completed;
      advanced = true;
    }

    if (advanced && !failure) {
      ReportProgress(ctx, static_cast<int>(completed * static_cast<std::size_t>(progress_span) / total));
    }
  }

  if (failure) {
    std::rethrow_exception(failure);
  }
}

// ------------------------------------------------------------------
// State updates
// ------------------------------------------------------------------

void TaskRunner::ReportProgress(const RunContext& ctx, int percent) {
  if (!store_->Mutate(ctx.task_id, [&](model::GenerationTask& t) { store_->Lifecycle().ReportStageProgress(t, percent); })) {
    throw util::Cancelled("task left the live states");
  }
  Publish(ctx.task_id);
}

void TaskRunner::StoreAsset(const RunContext& ctx, const Scene& scene, AssetSlot slot, const std::string& ref,
                            std::optional<double> actual_duration) {
  if (!store_->SetSceneAsset(ctx.task_id, scene.index, slot, ref, actual_duration)) {
    throw util::Cancelled("task left the live states");
  }
  REEL_LOG_DEBUG("scene asset stored", {StringField("task_id", ctx.task_id), IntField("scene", scene.index),
                                        StringField("slot", model::ToString(slot)), StringField("ref", ref)});
}

void TaskRunner::FinishCancelled(const RunContext& ctx) {
  // A Cancel request has usually recorded the transition already.
  const bool changed = store_->Mutate(ctx.task_id, [&](model::GenerationTask& t) { store_->Lifecycle().Cancel(t); });
  if (changed) {
    Publish(ctx.task_id);
  }
  observability::Metrics::Instance().RecordTaskOutcome("cancelled");
  REEL_LOG_INFO("task cancelled", {StringField("task_id", ctx.task_id)});
}

void TaskRunner::FinishFailed(const RunContext& ctx, const std::exception& error) {
  const std::string kind = util::ErrorKind(error);

  std::string stage;
  const bool  changed = store_->Mutate(ctx.task_id, [&](model::GenerationTask& t) {
    stage = std::string(model::ToString(t.stage));
    store_->Lifecycle().Fail(t, kind, stage + ": " + error.what());
  });
  if (changed) {
    Publish(ctx.task_id);
  }
  observability::Metrics::Instance().RecordTaskOutcome("failed");
  REEL_LOG_ERROR("task failed", {StringField("task_id", ctx.task_id), StringField("stage", stage), StringField("kind", kind),
                                 StringField("error", error.what())});
}

void TaskRunner::Publish(const std::string& task_id) {
  try {
    bus_->Publish(task_id);
  } catch (const std::exception& e) {
    REEL_LOG_WARN("progress publish failed", {StringField("task_id", task_id), StringField("error", e.what())});
  }
}

} // namespace reel::runner
