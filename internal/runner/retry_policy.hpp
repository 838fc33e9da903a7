#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/cancellation.hpp"
#include "internal/util/errors.hpp"

namespace reel::runner {

/*
  Bounded exponential backoff.

    delay(n) = min(max_backoff, initial_backoff * multiplier^(n-1))

  for the wait after the n-th failed attempt. Only errors for which
  util::IsRetryable() holds are retried.
*/
struct RetryPolicy {
  std::uint32_t             max_attempts = 3;
  std::chrono::milliseconds initial_backoff{1000};
  std::chrono::milliseconds max_backoff{30000};
  double                    multiplier = 2.0;

  std::chrono::milliseconds Delay(std::uint32_t failed_attempt) const;
};

/*
  Runs fn until it succeeds, fails with a non-retryable error, or
  max_attempts is reached; the last error is rethrown. Backoff sleeps wake
  up early and throw util::Cancelled when token is cancelled. Once deadline
  has passed no further attempt is made and util::TaskTimeout is thrown.
*/
template <typename Fn>
auto WithRetry(const RetryPolicy& policy, const util::CancellationToken& token, std::chrono::steady_clock::time_point deadline,
               const std::string& operation, Fn&& fn) -> decltype(fn()) {
  for (std::uint32_t attempt = 1;; ++attempt) {
    token.ThrowIfCancelled(operation);
    if (std::chrono::steady_clock::now() >= deadline) {
      throw util::TaskTimeout(operation + ": task exceeded its time limit");
    }
    try {
      return fn();
    } catch (const std::exception& e) {
      if (!util::IsRetryable(e) || attempt >= policy.max_attempts) {
        throw;
      }

      auto delay = policy.Delay(attempt);
      REEL_LOG_WARN("retrying after transient failure",
                    {observability::StringField("operation", operation), observability::IntField("attempt", attempt),
                     observability::IntField("backoff_ms", delay.count()), observability::StringField("error", e.what())});
      observability::Metrics::Instance().RecordProviderRetry(operation);

      if (deadline != std::chrono::steady_clock::time_point::max()) {
        const auto left = std::chrono::ceil<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        delay           = std::max(std::chrono::milliseconds{0}, std::min(delay, left));
      }
      if (token.WaitFor(delay)) {
        throw util::Cancelled(operation + ": cancelled during backoff");
      }
    }
  }
}

template <typename Fn>
auto WithRetry(const RetryPolicy& policy, const util::CancellationToken& token, const std::string& operation, Fn&& fn) -> decltype(fn()) {
  return WithRetry(policy, token, std::chrono::steady_clock::time_point::max(), operation, std::forward<Fn>(fn));
}

} // namespace reel::runner
