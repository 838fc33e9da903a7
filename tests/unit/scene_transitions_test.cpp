#include "internal/timing/scene_transitions.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <numeric>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using reel::timing::HasOverlap;
using reel::timing::JoinedDuration;
using reel::timing::PlanTransitions;
using reel::timing::TransitionOffsets;

bool Near(double a, double b, double eps = 1e-9) {
  return std::abs(a - b) <= eps;
}

void TestHardCutsLeaveScenesAlone() {
  const auto plan = PlanTransitions({4.0, 5.0, 3.0}, 0.0);
  assert(plan.overlaps == std::vector<double>({0.0, 0.0}));
  assert(plan.clips == std::vector<double>({4.0, 5.0, 3.0}));
  assert(!HasOverlap(plan.overlaps));
}

void TestClipsGrowByHalfOfEachNeighbour() {
  const auto plan = PlanTransitions({10.0, 10.0, 10.0}, 1.0);
  assert(plan.overlaps == std::vector<double>({1.0, 1.0}));
  assert(Near(plan.clips[0], 10.5));
  assert(Near(plan.clips[1], 11.0));
  assert(Near(plan.clips[2], 10.5));
  assert(Near(JoinedDuration(plan.clips, plan.overlaps), 30.0));
  assert(HasOverlap(plan.overlaps));
}

void TestSingleSceneHasNoTransition() {
  const auto plan = PlanTransitions({12.0}, 2.0);
  assert(plan.overlaps.empty());
  assert(plan.clips == std::vector<double>({12.0}));
  assert(Near(JoinedDuration(plan.clips, plan.overlaps), 12.0));
  assert(TransitionOffsets(plan.clips, plan.overlaps).empty());
}

void TestOverlapIsCappedByShortScene() {
  const auto plan = PlanTransitions({8.0, 0.5, 8.0}, 2.0);
  assert(Near(plan.overlaps[0], 0.5));
  assert(Near(plan.overlaps[1], 0.5));
  // The short clip still outlasts both crossfades it takes part in.
  assert(plan.clips[1] >= plan.overlaps[0]);
  assert(plan.clips[1] >= plan.overlaps[1]);
  assert(Near(JoinedDuration(plan.clips, plan.overlaps), 16.5));
}

void TestJoinedLengthMatchesSceneTotal() {
  const std::vector<double> scenes{3.0, 7.25, 4.5, 9.0, 3.25};
  for (const double t : {0.25, 1.0, 2.5, 5.0}) {
    const auto plan = PlanTransitions(scenes, t);
    assert(Near(JoinedDuration(plan.clips, plan.overlaps), std::accumulate(scenes.begin(), scenes.end(), 0.0)));
  }
}

void TestOffsetsFollowTheJoinedTimeline() {
  const auto offsets = TransitionOffsets({5.0, 6.0, 4.0}, {1.0, 2.0});
  assert(offsets.size() == 2);
  assert(Near(offsets[0], 4.0));
  // First two clips joined last 10s; the second crossfade takes its final 2s.
  assert(Near(offsets[1], 8.0));
}

void TestRejectsBadInput() {
  bool negative = false;
  try {
    PlanTransitions({4.0, 4.0}, -1.0);
  } catch (const reel::util::InvalidArgument&) {
    negative = true;
  }
  assert(negative);

  bool empty = false;
  try {
    PlanTransitions({}, 1.0);
  } catch (const reel::util::InvalidArgument&) {
    empty = true;
  }
  assert(empty);

  bool mismatched = false;
  try {
    JoinedDuration({4.0, 4.0}, {});
  } catch (const reel::util::InvalidArgument&) {
    mismatched = true;
  }
  assert(mismatched);
}

} // namespace

int main() {
  TestHardCutsLeaveScenesAlone();
  TestClipsGrowByHalfOfEachNeighbour();
  TestSingleSceneHasNoTransition();
  TestOverlapIsCappedByShortScene();
  TestJoinedLengthMatchesSceneTotal();
  TestOffsetsFollowTheJoinedTimeline();
  TestRejectsBadInput();

  std::cout << "reel_unit_scene_transitions: pass\n";
  return 0;
}
