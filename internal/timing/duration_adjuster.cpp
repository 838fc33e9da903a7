#include "duration_adjuster.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace reel::timing {

using media::EditOperation;
using media::MediaKind;

namespace obs = reel::observability;

double FadeDuration(double target_duration) {
  return std::min(1.0, target_duration / 4.0);
}

media::EditPlan PlanAdjustment(const media::ProbeResult& probe, double target, const AdjustOptions& options, double epsilon) {
  if (!(target > 0.0)) {
    throw util::InvalidArgument("target duration must be positive");
  }
  if (probe.kind != MediaKind::kAudio && probe.kind != MediaKind::kVideo) {
    throw util::InvalidArgument("cannot adjust duration of " + std::string(media::ToString(probe.kind)) + " asset");
  }

  media::EditPlan plan;
  plan.kind            = probe.kind;
  plan.input_duration  = probe.duration_seconds;
  plan.target_duration = target;
  plan.has_audio       = probe.kind == MediaKind::kAudio || probe.has_audio;

  const double diff = probe.duration_seconds - target;
  if (std::abs(diff) <= epsilon) {
    plan.op = EditOperation::kNone;
    return plan;
  }

  if (diff > 0.0) {
    plan.op = EditOperation::kTrim;
    if (options.fade_in) plan.fade_in_s = FadeDuration(target);
    if (options.fade_out) plan.fade_out_s = FadeDuration(target);
    return plan;
  }

  plan.tempo = probe.duration_seconds / target;
  plan.pitch = options.preserve_pitch ? media::PitchMode::kPreserve : media::PitchMode::kResample;
  if (probe.kind == MediaKind::kAudio) {
    plan.op = EditOperation::kStretchAudio;
  } else {
    plan.op                     = EditOperation::kHoldLastFrame;
    plan.stretch_embedded_audio = plan.has_audio && options.preserve_pitch;
  }
  return plan;
}

DurationAdjuster::DurationAdjuster(std::shared_ptr<media::MediaProbe> probe, std::shared_ptr<media::MediaEditor> editor,
                                   storage::AssetStorePtr store, AdjustPolicy policy)
    : probe_(std::move(probe)), editor_(std::move(editor)), store_(std::move(store)), policy_(policy) {
}

media::ProbeResult DurationAdjuster::ProbeWithRetry(const std::string& ref, const util::CancellationToken* token,
                                                    std::chrono::steady_clock::time_point deadline) const {
  static const util::CancellationToken kNeverCancelled;

  auto retry         = policy_.probe_retry;
  retry.max_attempts = std::max<std::uint32_t>(1, retry.max_attempts);

  return runner::WithRetry(retry, token ? *token : kNeverCancelled, deadline, "probe", [&] {
    auto result = probe_->Probe(ref);
    if (result.ok && result.duration_seconds > 0.0) {
      return result;
    }
    throw util::ProbeFailure("probe of " + ref + " failed: " + (result.ok ? std::string("zero duration") : result.error));
  });
}

AdjustResult DurationAdjuster::Adjust(const std::string& ref, double target, const AdjustOptions& options,
                                      const util::CancellationToken* token, std::chrono::steady_clock::time_point deadline) const {
  auto probe = ProbeWithRetry(ref, token, deadline);

  if (std::abs(probe.duration_seconds - target) <= policy_.epsilon) {
    return {ref, probe.duration_seconds, 0, false};
  }

  std::string   current = ref;
  AdjustOptions pass_options(options);

  const std::uint32_t max_passes = 1 + policy_.max_corrective_passes;
  for (std::uint32_t pass = 1; pass <= max_passes; ++pass) {
    if (token) token->ThrowIfCancelled("duration adjustment");
    if (std::chrono::steady_clock::now() >= deadline) {
      throw util::TaskTimeout("duration adjustment: task exceeded its time limit");
    }

    const auto plan   = PlanAdjustment(probe, target, pass_options, policy_.epsilon);
    const auto output = store_->ReserveSibling(current);
    editor_->Apply(plan, current, output);

    probe = ProbeWithRetry(output, token, deadline);
    if (std::abs(probe.duration_seconds - target) <= policy_.epsilon) {
      return {output, probe.duration_seconds, pass, true};
    }

    obs::LogWarn("adjusted duration off target",
                 {obs::StringField("ref", output), obs::DoubleField("target", target), obs::DoubleField("actual", probe.duration_seconds),
                  obs::IntField("pass", pass)});

    current               = output;
    pass_options.fade_in  = false;
    pass_options.fade_out = false;
  }

  throw util::AdjustmentDivergence("could not bring " + ref + " to " + std::to_string(target) + "s within " + std::to_string(max_passes) +
                                   " passes (last " + std::to_string(probe.duration_seconds) + "s)");
}

} // namespace reel::timing
