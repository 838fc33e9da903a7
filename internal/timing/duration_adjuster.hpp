#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "internal/media/edit_plan.hpp"
#include "internal/media/media_editor.hpp"
#include "internal/media/media_probe.hpp"
#include "internal/runner/retry_policy.hpp"
#include "internal/storage/asset_store.hpp"
#include "internal/util/cancellation.hpp"

namespace reel::timing {

struct AdjustOptions {
  bool fade_in        = false;
  bool fade_out       = false;
  bool preserve_pitch = true;
};

struct AdjustPolicy {
  double        epsilon               = 0.05;
  std::uint32_t max_corrective_passes = 3;
  // Probe failures back off exponentially, like provider calls.
  runner::RetryPolicy probe_retry{3, std::chrono::milliseconds{250}, std::chrono::milliseconds{5000}, 2.0};
};

struct AdjustResult {
  std::string   ref;
  double        duration = 0.0;
  std::uint32_t passes   = 0;
  bool          modified = false;
};

// Fade length used for trims: a quarter of the target, at most one second.
double FadeDuration(double target_duration);

/*
  Pure planning step. No IO.

    |actual - target| <= epsilon  -> kNone
    actual > target               -> kTrim (+ optional fades)
    actual < target, audio        -> kStretchAudio
    actual < target, video        -> kHoldLastFrame
*/
media::EditPlan PlanAdjustment(const media::ProbeResult& probe, double target, const AdjustOptions& options, double epsilon);

/*
  DurationAdjuster

  Normalizes one asset to a target duration and verifies the result by
  probing it. When the output misses the target, the output itself is
  re-planned and edited again (fades are only applied on the first pass).
  Gives up with util::AdjustmentDivergence after max_corrective_passes.

  An asset already within epsilon is returned as-is (same reference,
  modified=false).
*/
class DurationAdjuster {
 public:
  DurationAdjuster(std::shared_ptr<media::MediaProbe> probe, std::shared_ptr<media::MediaEditor> editor,
                   storage::AssetStorePtr store, AdjustPolicy policy = {});

  // Past deadline no further probe or edit is started (util::TaskTimeout).
  AdjustResult Adjust(const std::string& ref, double target, const AdjustOptions& options,
                      const util::CancellationToken*        token    = nullptr,
                      std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::time_point::max()) const;

  // Retries ProbeFailure under policy.probe_retry. Throws util::ProbeFailure
  // once attempts are exhausted.
  media::ProbeResult ProbeWithRetry(const std::string& ref, const util::CancellationToken* token = nullptr,
                                    std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::time_point::max()) const;

 private:
  std::shared_ptr<media::MediaProbe>  probe_;
  std::shared_ptr<media::MediaEditor> editor_;
  storage::AssetStorePtr              store_;
  AdjustPolicy                        policy_;
};

} // namespace reel::timing
