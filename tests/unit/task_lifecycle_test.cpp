#include "internal/core/task_lifecycle.hpp"

#include <cassert>
#include <iostream>

#include "internal/progress/progress_event.hpp"
#include "internal/util/errors.hpp"

namespace {

using reel::core::StageWeights;
using reel::core::TaskLifecycle;
using reel::model::GenerationTask;
using reel::model::TaskStatus;

template <typename Fn>
bool ThrowsInvalidState(Fn&& fn) {
  try {
    fn();
  } catch (const reel::util::InvalidState&) {
    return true;
  }
  return false;
}

void AdvanceThrough(const TaskLifecycle& lifecycle, GenerationTask& task, TaskStatus last) {
  for (const auto stage : reel::model::kPipeline) {
    lifecycle.EnterStage(task, stage);
    if (stage == last) return;
    lifecycle.ReportStageProgress(task, 100);
  }
}

void TestWeightsMustSumToHundred() {
  StageWeights weights;
  weights.values = {10, 10, 10, 10, 10, 10};

  bool threw = false;
  try {
    TaskLifecycle lifecycle(weights);
  } catch (const reel::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
  assert(StageWeights{}.Valid());
}

void TestStagesMustBeEnteredInOrder() {
  TaskLifecycle  lifecycle;
  GenerationTask task;

  assert(ThrowsInvalidState([&] { lifecycle.EnterStage(task, TaskStatus::kGeneratingScenes); }));

  lifecycle.EnterStage(task, TaskStatus::kAnalyzingPrompt);
  // The previous stage has to report 100 first.
  assert(ThrowsInvalidState([&] { lifecycle.EnterStage(task, TaskStatus::kGeneratingScenes); }));

  lifecycle.ReportStageProgress(task, 100);
  lifecycle.EnterStage(task, TaskStatus::kGeneratingScenes);
  assert(task.status == TaskStatus::kGeneratingScenes);
  assert(task.EnteredStages() == 2);
}

void TestStageProgressIsMonotonicAndClamped() {
  TaskLifecycle  lifecycle;
  GenerationTask task;
  lifecycle.EnterStage(task, TaskStatus::kAnalyzingPrompt);

  lifecycle.ReportStageProgress(task, 60);
  lifecycle.ReportStageProgress(task, 40);
  assert(task.stage_progress[0] == 60);

  lifecycle.ReportStageProgress(task, 250);
  assert(task.stage_progress[0] == 100);
}

void TestOverallProgressIsWeighted() {
  TaskLifecycle  lifecycle;
  GenerationTask task;

  AdvanceThrough(lifecycle, task, TaskStatus::kGeneratingImages);
  lifecycle.ReportStageProgress(task, 50);

  // 5 + 10 + 25 * 0.5, truncated
  assert(lifecycle.OverallProgress(task) == 27);

  const auto event = reel::progress::BuildProgressEvent(task, lifecycle.OverallProgress(task));
  assert(event.stage_progress().size() == 3);
  assert(event.stage_progress().at("generating_images") == 50);
  assert(event.overall_progress() == 27);
}

void TestCompleteRequiresFinalStage() {
  TaskLifecycle  lifecycle;
  GenerationTask task;

  AdvanceThrough(lifecycle, task, TaskStatus::kGeneratingMusic);
  assert(ThrowsInvalidState([&] { lifecycle.Complete(task, {}); }));

  lifecycle.ReportStageProgress(task, 100);
  lifecycle.EnterStage(task, TaskStatus::kAssemblingVideo);
  assert(ThrowsInvalidState([&] { lifecycle.Complete(task, {}); }));

  lifecycle.ReportStageProgress(task, 100);
  reel::orchestrator::v1::TaskResult result;
  result.set_video_ref("asset://video.mp4");
  lifecycle.Complete(task, result);

  assert(task.status == TaskStatus::kCompleted);
  assert(lifecycle.OverallProgress(task) == 100);
  assert(task.result->video_ref() == "asset://video.mp4");
}

void TestFailRecordsStageAndKind() {
  TaskLifecycle  lifecycle;
  GenerationTask task;
  AdvanceThrough(lifecycle, task, TaskStatus::kGeneratingAudio);

  lifecycle.Fail(task, "provider_permanent", "generating_audio: voice rejected");

  assert(task.status == TaskStatus::kFailed);
  assert(task.stage == TaskStatus::kGeneratingAudio);
  assert(task.error->stage() == "generating_audio");
  assert(task.error->kind() == "provider_permanent");
  assert(task.message == "generating_audio: voice rejected");
}

void TestTerminalStatesAreFrozen() {
  TaskLifecycle  lifecycle;
  GenerationTask task;
  lifecycle.Cancel(task);
  assert(task.status == TaskStatus::kCancelled);

  assert(ThrowsInvalidState([&] { lifecycle.Cancel(task); }));
  assert(ThrowsInvalidState([&] { lifecycle.Fail(task, "internal", "late"); }));
  assert(ThrowsInvalidState([&] { lifecycle.EnterStage(task, TaskStatus::kAnalyzingPrompt); }));
  assert(ThrowsInvalidState([&] { lifecycle.ReportStageProgress(task, 10); }));
}

} // namespace

int main() {
  TestWeightsMustSumToHundred();
  TestStagesMustBeEnteredInOrder();
  TestStageProgressIsMonotonicAndClamped();
  TestOverallProgressIsWeighted();
  TestCompleteRequiresFinalStage();
  TestFailRecordsStageAndKind();
  TestTerminalStatesAreFrozen();

  std::cout << "reel_unit_task_lifecycle: pass\n";
  return 0;
}
