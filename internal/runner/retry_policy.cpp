#include "retry_policy.hpp"

#include <algorithm>
#include <cmath>

namespace reel::runner {

std::chrono::milliseconds RetryPolicy::Delay(std::uint32_t failed_attempt) const {
  if (failed_attempt == 0) {
    return std::chrono::milliseconds{0};
  }
  const double scaled = static_cast<double>(initial_backoff.count()) * std::pow(multiplier, static_cast<double>(failed_attempt - 1));
  const double capped = std::min(scaled, static_cast<double>(max_backoff.count()));
  return std::chrono::milliseconds{static_cast<std::int64_t>(capped)};
}

} // namespace reel::runner
