#pragma once

#include <vector>

namespace reel::timing {

/*
  Crossfade timing between consecutive scenes.

  A crossfade of t seconds overlaps the tail of one clip with the head of
  the next, so the joined video is sum(clips) - sum(t). To keep each scene
  on screen for its allocated duration, every clip is lengthened by half
  of each adjacent crossfade:

    clip_i = scene_i + t_(i-1) / 2 + t_i / 2

  which makes the joined length equal sum(scene_i) again.
*/
struct TransitionPlan {
  std::vector<double> overlaps; // n - 1 entries, between clip i and i + 1
  std::vector<double> clips;    // n entries, fit targets for each clip
};

// Requested crossfades are capped at the shorter neighbouring scene. A zero
// transition yields hard cuts (all overlaps zero, clips equal to scenes).
// Throws util::InvalidArgument for a negative transition or no scenes.
TransitionPlan PlanTransitions(const std::vector<double>& scene_durations, double transition_s);

// Length of clips joined with the given overlaps.
double JoinedDuration(const std::vector<double>& clips, const std::vector<double>& overlaps);

// Start of crossfade i measured on the joined timeline.
std::vector<double> TransitionOffsets(const std::vector<double>& clips, const std::vector<double>& overlaps);

bool HasOverlap(const std::vector<double>& overlaps);

} // namespace reel::timing
