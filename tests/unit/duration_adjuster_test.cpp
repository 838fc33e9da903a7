#include "internal/timing/duration_adjuster.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <thread>

#include "internal/storage/memory_asset_store.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/fake_media_tool.hpp"

namespace {

using reel::media::EditOperation;
using reel::media::MediaKind;
using reel::media::PitchMode;
using reel::media::ProbeResult;
using reel::timing::AdjustOptions;
using reel::timing::AdjustPolicy;
using reel::timing::DurationAdjuster;
using reel::timing::PlanAdjustment;

bool Near(double a, double b, double eps = 1e-9) {
  return std::abs(a - b) <= eps;
}

ProbeResult Probed(MediaKind kind, double duration, bool has_audio = false) {
  ProbeResult probe;
  probe.ok               = true;
  probe.kind             = kind;
  probe.duration_seconds = duration;
  probe.has_audio        = has_audio;
  return probe;
}

struct Harness {
  std::shared_ptr<reel::storage::MemoryAssetStore> store = std::make_shared<reel::storage::MemoryAssetStore>();
  std::shared_ptr<reel::testing::FakeMediaTool>    media = std::make_shared<reel::testing::FakeMediaTool>();

  DurationAdjuster Adjuster(AdjustPolicy policy = {}) {
    policy.probe_retry.initial_backoff = std::chrono::milliseconds(1);
    return DurationAdjuster(media, media, store, policy);
  }

  std::string Add(MediaKind kind, double duration, bool has_audio = false) {
    auto ref = store->Put("x", kind == MediaKind::kAudio ? "wav" : "mp4");
    media->Register(ref, kind, duration, has_audio);
    return ref;
  }
};

void TestPlanWithinEpsilonIsNoOp() {
  const auto plan = PlanAdjustment(Probed(MediaKind::kAudio, 5.04), 5.0, AdjustOptions{}, 0.05);
  assert(plan.op == EditOperation::kNone);
}

void TestPlanLongerThanTargetTrimsWithFades() {
  AdjustOptions options;
  options.fade_in  = true;
  options.fade_out = true;

  const auto plan = PlanAdjustment(Probed(MediaKind::kAudio, 10.0), 8.0, options, 0.05);
  assert(plan.op == EditOperation::kTrim);
  assert(Near(plan.fade_in_s, 1.0));
  assert(Near(plan.fade_out_s, 1.0));

  // Short targets get a quarter-length fade.
  const auto short_plan = PlanAdjustment(Probed(MediaKind::kAudio, 3.0), 2.0, options, 0.05);
  assert(Near(short_plan.fade_out_s, 0.5));
}

void TestPlanShortAudioStretches() {
  const auto plan = PlanAdjustment(Probed(MediaKind::kAudio, 4.0), 5.0, AdjustOptions{}, 0.05);
  assert(plan.op == EditOperation::kStretchAudio);
  assert(Near(plan.tempo, 0.8));
  assert(plan.pitch == PitchMode::kPreserve);

  AdjustOptions resample;
  resample.preserve_pitch = false;
  assert(PlanAdjustment(Probed(MediaKind::kAudio, 4.0), 5.0, resample, 0.05).pitch == PitchMode::kResample);
}

void TestPlanShortVideoHoldsLastFrame() {
  const auto plan = PlanAdjustment(Probed(MediaKind::kVideo, 3.0, true), 5.0, AdjustOptions{}, 0.05);
  assert(plan.op == EditOperation::kHoldLastFrame);
  assert(plan.has_audio);
  assert(plan.stretch_embedded_audio);

  const auto silent = PlanAdjustment(Probed(MediaKind::kVideo, 3.0, false), 5.0, AdjustOptions{}, 0.05);
  assert(!silent.stretch_embedded_audio);
}

void TestPlanRejectsImagesAndBadTargets() {
  bool image_threw = false;
  try {
    PlanAdjustment(Probed(MediaKind::kImage, 0.0), 5.0, AdjustOptions{}, 0.05);
  } catch (const reel::util::InvalidArgument&) {
    image_threw = true;
  }
  assert(image_threw);

  bool target_threw = false;
  try {
    PlanAdjustment(Probed(MediaKind::kAudio, 3.0), 0.0, AdjustOptions{}, 0.05);
  } catch (const reel::util::InvalidArgument&) {
    target_threw = true;
  }
  assert(target_threw);
}

void TestAdjustReturnsInputWhenAlreadyOnTarget() {
  Harness    h;
  const auto ref    = h.Add(MediaKind::kAudio, 6.02);
  const auto result = h.Adjuster().Adjust(ref, 6.0, AdjustOptions{});

  assert(result.ref == ref);
  assert(!result.modified);
  assert(result.passes == 0);
  assert(h.media->Plans().empty());
}

void TestAdjustTrimsToTarget() {
  Harness    h;
  const auto ref    = h.Add(MediaKind::kAudio, 9.0);
  const auto result = h.Adjuster().Adjust(ref, 6.0, AdjustOptions{});

  assert(result.ref != ref);
  assert(result.modified);
  assert(result.passes == 1);
  assert(Near(result.duration, 6.0));
  assert(h.media->Plans().front().op == EditOperation::kTrim);
}

void TestAdjustRunsCorrectivePassOnDrift() {
  Harness h;
  h.media->QueueDrift({-0.3, 0.0});

  AdjustOptions options;
  options.fade_out = true;

  const auto ref    = h.Add(MediaKind::kAudio, 9.0);
  const auto result = h.Adjuster().Adjust(ref, 6.0, options);

  assert(result.passes == 2);
  assert(Near(result.duration, 6.0));

  const auto plans = h.media->Plans();
  assert(plans.size() == 2);
  assert(plans[0].op == EditOperation::kTrim);
  assert(plans[0].fade_out_s > 0.0);
  // The corrective pass stretches the short output and never re-fades.
  assert(plans[1].op == EditOperation::kStretchAudio);
  assert(plans[1].fade_out_s == 0.0);
}

void TestAdjustGivesUpAfterMaxPasses() {
  Harness h;
  h.media->QueueDrift({0.5, 0.5, 0.5});

  AdjustPolicy policy;
  policy.max_corrective_passes = 2;

  const auto ref   = h.Add(MediaKind::kVideo, 2.0);
  bool       threw = false;
  try {
    h.Adjuster(policy).Adjust(ref, 4.0, AdjustOptions{});
  } catch (const reel::util::AdjustmentDivergence&) {
    threw = true;
  }
  assert(threw);
  assert(h.media->Plans().size() == 3);
}

void TestProbeIsRetriedThenFails() {
  Harness    h;
  const auto ref = h.Add(MediaKind::kAudio, 5.0);

  h.media->FailNextProbes(2);
  const auto probe = h.Adjuster().ProbeWithRetry(ref);
  assert(probe.ok);
  assert(h.media->ProbeCalls() == 3);

  h.media->FailNextProbes(3);
  bool threw = false;
  try {
    h.Adjuster().ProbeWithRetry(ref);
  } catch (const reel::util::ProbeFailure&) {
    threw = true;
  }
  assert(threw);
}

void TestCancelledTokenStopsAdjustment() {
  Harness    h;
  const auto ref = h.Add(MediaKind::kAudio, 9.0);

  reel::util::CancellationToken token;
  token.Cancel();

  bool threw = false;
  try {
    h.Adjuster().Adjust(ref, 6.0, AdjustOptions{}, &token);
  } catch (const reel::util::Cancelled&) {
    threw = true;
  }
  assert(threw);
  assert(h.media->Plans().empty());
}

void TestProbeBackoffIsExponential() {
  Harness    h;
  const auto ref = h.Add(MediaKind::kAudio, 5.0);

  AdjustPolicy policy;
  policy.probe_retry = {4, std::chrono::milliseconds(20), std::chrono::milliseconds(1000), 3.0};
  DurationAdjuster adjuster(h.media, h.media, h.store, policy);

  // Waits of 20, 60 and 180ms; a linear schedule would sleep 120ms in total.
  h.media->FailNextProbes(3);
  const auto started = std::chrono::steady_clock::now();
  const auto probe   = adjuster.ProbeWithRetry(ref);
  const auto elapsed = std::chrono::steady_clock::now() - started;

  assert(probe.ok);
  assert(h.media->ProbeCalls() == 4);
  assert(elapsed >= std::chrono::milliseconds(250));
}

void TestCancelInterruptsProbeBackoff() {
  Harness    h;
  const auto ref = h.Add(MediaKind::kAudio, 5.0);

  AdjustPolicy policy;
  policy.probe_retry = {3, std::chrono::seconds(5), std::chrono::seconds(5), 2.0};
  DurationAdjuster adjuster(h.media, h.media, h.store, policy);

  reel::util::CancellationToken token;
  std::thread                   canceller([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    token.Cancel();
  });

  h.media->FailNextProbes(3);
  const auto started = std::chrono::steady_clock::now();
  bool       threw   = false;
  try {
    adjuster.ProbeWithRetry(ref, &token);
  } catch (const reel::util::Cancelled&) {
    threw = true;
  }
  canceller.join();

  assert(threw);
  assert(h.media->ProbeCalls() == 1);
  assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(2));
}

void TestDeadlineStopsProbeRetries() {
  Harness    h;
  const auto ref = h.Add(MediaKind::kAudio, 9.0);

  AdjustPolicy policy;
  policy.probe_retry = {10, std::chrono::seconds(5), std::chrono::seconds(5), 2.0};
  DurationAdjuster adjuster(h.media, h.media, h.store, policy);

  h.media->FailNextProbes(100);
  const auto started = std::chrono::steady_clock::now();
  bool       threw   = false;
  try {
    adjuster.Adjust(ref, 6.0, AdjustOptions{}, nullptr, started + std::chrono::milliseconds(100));
  } catch (const reel::util::TaskTimeout&) {
    threw = true;
  }

  assert(threw);
  assert(h.media->ProbeCalls() == 1);
  assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(2));
  assert(h.media->Plans().empty());
}

void TestExpiredDeadlineStartsNoEdit() {
  Harness    h;
  const auto ref = h.Add(MediaKind::kAudio, 9.0);

  bool threw = false;
  try {
    h.Adjuster().Adjust(ref, 6.0, AdjustOptions{}, nullptr, std::chrono::steady_clock::now() - std::chrono::milliseconds(1));
  } catch (const reel::util::TaskTimeout&) {
    threw = true;
  }
  assert(threw);
  assert(h.media->ProbeCalls() == 0);
}

} // namespace

int main() {
  TestPlanWithinEpsilonIsNoOp();
  TestPlanLongerThanTargetTrimsWithFades();
  TestPlanShortAudioStretches();
  TestPlanShortVideoHoldsLastFrame();
  TestPlanRejectsImagesAndBadTargets();
  TestAdjustReturnsInputWhenAlreadyOnTarget();
  TestAdjustTrimsToTarget();
  TestAdjustRunsCorrectivePassOnDrift();
  TestAdjustGivesUpAfterMaxPasses();
  TestProbeIsRetriedThenFails();
  TestCancelledTokenStopsAdjustment();
  TestProbeBackoffIsExponential();
  TestCancelInterruptsProbeBackoff();
  TestDeadlineStopsProbeRetries();
  TestExpiredDeadlineStartsNoEdit();

  std::cout << "reel_unit_duration_adjuster: pass\n";
  return 0;
}
