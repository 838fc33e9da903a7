#include "scene_duration_allocator.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <string>

#include "internal/util/errors.hpp"

namespace reel::timing {

namespace {

// Absorbs floating point noise when comparing shares against the floor.
constexpr double kTolerance = 1e-9;

double RoundTo(double value, double scale) {
  return std::round(value * scale) / scale;
}

void Validate(const std::vector<double>& weights, double total, double floor) {
  if (weights.empty()) {
    throw util::ConstraintViolation("no scenes to allocate");
  }
  if (!(total > 0.0) || !std::isfinite(total)) {
    throw util::ConstraintViolation("total duration must be positive, got " + std::to_string(total));
  }
  if (floor < 0.0 || !std::isfinite(floor)) {
    throw util::ConstraintViolation("minimum scene duration must be non-negative");
  }
  for (double w : weights) {
    if (w < 0.0 || !std::isfinite(w)) {
      throw util::ConstraintViolation("scene weights must be finite and non-negative");
    }
  }
  const double required = floor * static_cast<double>(weights.size());
  if (required > total + kTolerance) {
    throw util::ConstraintViolation(std::to_string(weights.size()) + " scenes need at least " + std::to_string(required) +
                                    "s but total duration is " + std::to_string(total) + "s");
  }
}

} // namespace

SceneDurationAllocator::SceneDurationAllocator(AllocationOptions options) : options_(options) {
}

std::vector<double> SceneDurationAllocator::Allocate(const std::vector<double>& input_weights, double total) const {
  const double floor = options_.min_scene_duration;
  Validate(input_weights, total, floor);

  const std::size_t   n = input_weights.size();
  std::vector<double> weights(input_weights);
  if (std::accumulate(weights.begin(), weights.end(), 0.0) <= 0.0) {
    std::fill(weights.begin(), weights.end(), 1.0);
  }

  std::vector<double> durations(n, 0.0);
  std::vector<bool>   pinned(n, false);
  std::size_t         pinned_count = 0;

  // Each round pins at least one more scene or terminates, so n rounds suffice.
  for (std::size_t round = 0; round <= n; ++round) {
    const double remaining = total - floor * static_cast<double>(pinned_count);

    double free_weight = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
      if (!pinned[i]) free_weight += weights[i];
    }
    const std::size_t free_count = n - pinned_count;

    bool newly_pinned = false;
    for (std::size_t i = 0; i < n; ++i) {
      if (pinned[i]) {
        durations[i] = floor;
        continue;
      }
      durations[i] = free_weight > 0.0 ? weights[i] / free_weight * remaining : remaining / static_cast<double>(free_count);
      if (durations[i] < floor - kTolerance) {
        pinned[i]    = true;
        durations[i] = floor;
        newly_pinned = true;
        ++pinned_count;
      }
    }

    if (!newly_pinned || pinned_count == n) {
      break;
    }
  }

  // Round everything but the last scene; the last one takes the residual.
  const double scale = std::pow(10.0, static_cast<double>(options_.rounding_decimals));
  double       assigned = 0.0;
  for (std::size_t i = 0; i + 1 < n; ++i) {
    durations[i] = pinned[i] ? floor : std::max(RoundTo(durations[i], scale), floor);
    assigned += durations[i];
  }
  durations[n - 1] = total - assigned;

  // Rounding up earlier scenes can push the last one under the floor. Take
  // the shortfall back from the longest scenes.
  double shortfall = floor - durations[n - 1];
  while (shortfall > kTolerance) {
    auto   longest = std::max_element(durations.begin(), durations.end() - 1);
    double spare   = *longest - floor;
    if (spare <= kTolerance) {
      throw util::ConstraintViolation("cannot satisfy minimum scene duration after rounding");
    }
    double take = std::min(spare, shortfall);
    *longest -= take;
    durations[n - 1] += take;
    shortfall -= take;
  }

  return durations;
}

void SceneDurationAllocator::Apply(std::vector<model::Scene>& scenes, double total_duration) const {
  std::sort(scenes.begin(), scenes.end(), [](const model::Scene& a, const model::Scene& b) { return a.index < b.index; });

  std::vector<double> weights;
  weights.reserve(scenes.size());
  for (const auto& scene : scenes) {
    weights.push_back(scene.weight);
  }

  auto durations = Allocate(weights, total_duration);
  for (std::size_t i = 0; i < scenes.size(); ++i) {
    scenes[i].target_duration = durations[i];
  }
}

} // namespace reel::timing
