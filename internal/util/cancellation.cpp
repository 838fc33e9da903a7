#include "cancellation.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace reel::util {

namespace {

// Parent cancellation does not notify children, so waits re-check this often.
constexpr std::chrono::milliseconds kParentPollInterval{50};

} // namespace

CancellationToken::CancellationToken(std::shared_ptr<const CancellationToken> parent) : parent_(std::move(parent)) {
}

void CancellationToken::Cancel() {
  {
    std::lock_guard lock(mutex_);
    cancelled_ = true;
  }
  cv_.notify_all();
}

bool CancellationToken::IsCancelled() const {
  return cancelled_.load() || (parent_ && parent_->IsCancelled());
}

void CancellationToken::ThrowIfCancelled(const std::string& where) const {
  if (IsCancelled()) {
    throw Cancelled(where.empty() ? "cancelled" : "cancelled during " + where);
  }
}

bool CancellationToken::WaitFor(std::chrono::milliseconds timeout) const {
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  std::unique_lock lock(mutex_);
  while (!IsCancelled()) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return false;
    }
    auto slice = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    if (parent_) {
      slice = std::min(slice, kParentPollInterval);
    }
    cv_.wait_for(lock, slice);
  }
  return true;
}

} // namespace reel::util
