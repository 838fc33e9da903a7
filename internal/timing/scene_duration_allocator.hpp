#pragma once

#include <cstdint>
#include <vector>

#include "internal/model/scene.hpp"

namespace reel::timing {

struct AllocationOptions {
  double        min_scene_duration = 3.0;
  std::uint32_t rounding_decimals  = 2;
};

/*
  SceneDurationAllocator

  Distributes a total duration over weighted scenes by iterative
  water-filling:

    1. share_i = w_i / sum(w) * remaining
    2. scenes whose share falls under the floor are pinned to the floor
    3. the rest of the budget is re-split among unpinned scenes
    4. repeat until no new scene gets pinned

  Results are rounded to rounding_decimals and the last scene absorbs the
  residual so the durations sum to the total. Throws
  util::ConstraintViolation when min_scene_duration * n > total.
*/
class SceneDurationAllocator {
 public:
  explicit SceneDurationAllocator(AllocationOptions options = {});

  std::vector<double> Allocate(const std::vector<double>& weights, double total_duration) const;

  // Writes target_duration into each scene, in index order.
  void Apply(std::vector<model::Scene>& scenes, double total_duration) const;

  const AllocationOptions& Options() const {
    return options_;
  }

 private:
  AllocationOptions options_;
};

} // namespace reel::timing
