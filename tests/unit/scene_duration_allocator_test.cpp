#include "internal/timing/scene_duration_allocator.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <numeric>
#include <random>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using reel::timing::AllocationOptions;
using reel::timing::SceneDurationAllocator;

bool Near(double a, double b, double eps = 1e-9) {
  return std::abs(a - b) <= eps;
}

double Sum(const std::vector<double>& values) {
  return std::accumulate(values.begin(), values.end(), 0.0);
}

void TestEqualWeightsSplitEvenly() {
  SceneDurationAllocator allocator;
  const auto             durations = allocator.Allocate({1.0, 1.0, 1.0, 1.0}, 30.0);

  assert(durations.size() == 4);
  assert(Near(durations[0], 7.5));
  assert(Near(durations[3], 7.5));
  assert(Near(Sum(durations), 30.0));
}

void TestWeightsAreProportional() {
  SceneDurationAllocator allocator;
  const auto             durations = allocator.Allocate({1.0, 2.0, 3.0}, 60.0);

  assert(Near(durations[0], 10.0));
  assert(Near(durations[1], 20.0));
  assert(Near(durations[2], 30.0));
}

void TestSmallWeightIsPinnedToFloor() {
  SceneDurationAllocator allocator(AllocationOptions{3.0, 2});
  const auto             durations = allocator.Allocate({0.1, 1.0, 1.0}, 20.0);

  // 0.1/2.1*20 = 0.95 < 3 -> pinned, the remaining 17s split evenly.
  assert(Near(durations[0], 3.0));
  assert(Near(durations[1], 8.5));
  assert(Near(durations[2], 8.5));
  assert(Near(Sum(durations), 20.0));
}

void TestPinningCascadesUntilStable() {
  SceneDurationAllocator allocator(AllocationOptions{3.0, 2});
  // First round pins scene 0; the re-split pushes scene 1 under the floor too.
  const auto durations = allocator.Allocate({1.0, 3.5, 10.0}, 13.0);

  assert(Near(durations[0], 3.0));
  assert(Near(durations[1], 3.0));
  assert(Near(durations[2], 7.0));
  for (double d : durations) {
    assert(d >= 3.0 - 1e-9);
  }
}

void TestLastSceneAbsorbsRoundingResidual() {
  SceneDurationAllocator allocator(AllocationOptions{0.0, 2});
  const auto             durations = allocator.Allocate({1.0, 1.0, 1.0}, 10.0);

  assert(Near(durations[0], 3.33));
  assert(Near(durations[1], 3.33));
  assert(Near(durations[2], 3.34, 1e-6));
  assert(Near(Sum(durations), 10.0, 1e-9));
}

void TestZeroWeightsFallBackToEqualSplit() {
  SceneDurationAllocator allocator;
  const auto             durations = allocator.Allocate({0.0, 0.0}, 12.0);

  assert(Near(durations[0], 6.0));
  assert(Near(durations[1], 6.0));
}

void TestExactFloorBudgetIsAccepted() {
  SceneDurationAllocator allocator(AllocationOptions{3.0, 2});
  const auto             durations = allocator.Allocate({5.0, 1.0, 1.0}, 9.0);

  for (double d : durations) {
    assert(Near(d, 3.0));
  }
}

void TestInsufficientTotalIsConstraintViolation() {
  SceneDurationAllocator allocator(AllocationOptions{3.0, 2});

  bool threw = false;
  try {
    allocator.Allocate({1.0, 1.0, 1.0, 1.0}, 10.0);
  } catch (const reel::util::ConstraintViolation&) {
    threw = true;
  }
  assert(threw);
}

void TestEmptyOrNegativeInputIsRejected() {
  SceneDurationAllocator allocator;

  bool empty_threw = false;
  try {
    allocator.Allocate({}, 10.0);
  } catch (const reel::util::ConstraintViolation&) {
    empty_threw = true;
  }
  assert(empty_threw);

  bool negative_threw = false;
  try {
    allocator.Allocate({1.0, -1.0}, 10.0);
  } catch (const reel::util::ConstraintViolation&) {
    negative_threw = true;
  }
  assert(negative_threw);
}

void TestApplyWritesTargetsInIndexOrder() {
  std::vector<reel::model::Scene> scenes(2);
  scenes[0].index  = 1;
  scenes[0].weight = 3.0;
  scenes[1].index  = 0;
  scenes[1].weight = 1.0;

  SceneDurationAllocator(AllocationOptions{0.0, 2}).Apply(scenes, 20.0);

  assert(scenes[0].index == 0);
  assert(Near(scenes[0].target_duration, 5.0));
  assert(Near(scenes[1].target_duration, 15.0));
}

void TestThreeEqualScenesGetTenSecondsEach() {
  SceneDurationAllocator allocator(AllocationOptions{3.0, 2});
  const auto             durations = allocator.Allocate({1.0, 1.0, 1.0}, 30.0);

  assert(durations.size() == 3);
  for (double d : durations) {
    assert(Near(d, 10.0));
  }
}

void TestHeavySceneLeavesOthersOnTheFloor() {
  SceneDurationAllocator allocator(AllocationOptions{3.0, 2});
  // Raw shares 15/3/3: the light scenes sit exactly on the floor.
  const auto durations = allocator.Allocate({5.0, 1.0, 1.0}, 21.0);

  assert(Near(durations[0], 15.0));
  assert(Near(durations[1], 3.0));
  assert(Near(durations[2], 3.0));
  assert(Near(Sum(durations), 21.0));
}

void TestAllocationIsIdempotent() {
  SceneDurationAllocator allocator(AllocationOptions{3.0, 2});
  const std::vector<double> weights{5.0, 1.0, 1.0, 0.2, 2.5};

  const auto first = allocator.Allocate(weights, 37.0);
  assert(allocator.Allocate(weights, 37.0) == first);

  // Feeding an allocation back in as weights reproduces it.
  const auto again = allocator.Allocate(first, 37.0);
  for (std::size_t i = 0; i < first.size(); ++i) {
    assert(Near(again[i], first[i], 1e-6));
  }
}

void TestRandomInputsKeepSumAndFloor() {
  std::mt19937                           rng(20240617);
  std::uniform_int_distribution<int>     scene_count(1, 8);
  std::uniform_int_distribution<int>     floor_cents(0, 500);
  std::uniform_int_distribution<int>     slack_cents(0, 12000);
  std::uniform_real_distribution<double> weight(0.0, 10.0);
  std::bernoulli_distribution            zero_weight(0.15);

  for (int round = 0; round < 5000; ++round) {
    const int    n     = scene_count(rng);
    const double floor = floor_cents(rng) / 100.0;
    // Cent-aligned, feasible, and at least one cent above the floors.
    const double total = floor * n + (slack_cents(rng) + 1) / 100.0;

    std::vector<double> weights(static_cast<std::size_t>(n));
    for (auto& w : weights) {
      w = zero_weight(rng) ? 0.0 : weight(rng);
    }

    SceneDurationAllocator allocator(AllocationOptions{floor, 2});
    const auto             durations = allocator.Allocate(weights, total);

    assert(durations.size() == weights.size());
    assert(Near(Sum(durations), total, 1e-6));
    for (double d : durations) {
      assert(d >= floor - 1e-6);
    }

    assert(allocator.Allocate(weights, total) == durations);
    const auto again = allocator.Allocate(durations, total);
    for (std::size_t i = 0; i < durations.size(); ++i) {
      assert(Near(again[i], durations[i], 1e-6));
    }
  }
}

} // namespace

int main() {
  TestEqualWeightsSplitEvenly();
  TestWeightsAreProportional();
  TestSmallWeightIsPinnedToFloor();
  TestPinningCascadesUntilStable();
  TestLastSceneAbsorbsRoundingResidual();
  TestZeroWeightsFallBackToEqualSplit();
  TestExactFloorBudgetIsAccepted();
  TestInsufficientTotalIsConstraintViolation();
  TestEmptyOrNegativeInputIsRejected();
  TestApplyWritesTargetsInIndexOrder();
  TestThreeEqualScenesGetTenSecondsEach();
  TestHeavySceneLeavesOthersOnTheFloor();
  TestAllocationIsIdempotent();
  TestRandomInputsKeepSumAndFloor();

  std::cout << "reel_unit_scene_duration_allocator: pass\n";
  return 0;
}
