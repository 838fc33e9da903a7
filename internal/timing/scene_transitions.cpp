#include "scene_transitions.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <string>

#include "internal/util/errors.hpp"

namespace reel::timing {

namespace {

void CheckSizes(const std::vector<double>& clips, const std::vector<double>& overlaps) {
  if (clips.empty() || overlaps.size() != clips.size() - 1) {
    throw util::InvalidArgument("transition plan needs one overlap between each pair of clips, got " +
                                std::to_string(overlaps.size()) + " for " + std::to_string(clips.size()) + " clips");
  }
}

} // namespace

TransitionPlan PlanTransitions(const std::vector<double>& scene_durations, double transition_s) {
  if (scene_durations.empty()) {
    throw util::InvalidArgument("no scenes to join");
  }
  if (!(transition_s >= 0.0) || !std::isfinite(transition_s)) {
    throw util::InvalidArgument("transition duration must be non-negative");
  }

  TransitionPlan plan;
  plan.overlaps.reserve(scene_durations.size() - 1);
  for (std::size_t i = 0; i + 1 < scene_durations.size(); ++i) {
    plan.overlaps.push_back(std::min({transition_s, scene_durations[i], scene_durations[i + 1]}));
  }

  plan.clips = scene_durations;
  for (std::size_t i = 0; i < plan.overlaps.size(); ++i) {
    plan.clips[i] += plan.overlaps[i] / 2.0;
    plan.clips[i + 1] += plan.overlaps[i] / 2.0;
  }
  return plan;
}

double JoinedDuration(const std::vector<double>& clips, const std::vector<double>& overlaps) {
  CheckSizes(clips, overlaps);
  return std::accumulate(clips.begin(), clips.end(), 0.0) - std::accumulate(overlaps.begin(), overlaps.end(), 0.0);
}

std::vector<double> TransitionOffsets(const std::vector<double>& clips, const std::vector<double>& overlaps) {
  CheckSizes(clips, overlaps);

  std::vector<double> offsets;
  offsets.reserve(overlaps.size());
  double end = 0.0;
  for (std::size_t i = 0; i < overlaps.size(); ++i) {
    end += clips[i];
    offsets.push_back(end - overlaps[i]);
    end -= overlaps[i];
  }
  return offsets;
}

bool HasOverlap(const std::vector<double>& overlaps) {
  return std::any_of(overlaps.begin(), overlaps.end(), [](double t) { return t > 0.0; });
}

} // namespace reel::timing
