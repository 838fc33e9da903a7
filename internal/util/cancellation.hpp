#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

namespace reel::util {

/*
  Cooperative cancellation signal.

  A token cancels when it or any ancestor is cancelled. Work checks the
  token at every suspension point; nothing is interrupted forcibly.
*/
class CancellationToken {
 public:
  CancellationToken() = default;
  explicit CancellationToken(std::shared_ptr<const CancellationToken> parent);

  CancellationToken(const CancellationToken&)            = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  void Cancel();
  bool IsCancelled() const;

  // Throws util::Cancelled if cancelled.
  void ThrowIfCancelled(const std::string& where = {}) const;

  // Sleeps for up to timeout. Returns true if cancellation was observed.
  bool WaitFor(std::chrono::milliseconds timeout) const;

 private:
  std::shared_ptr<const CancellationToken> parent_;
  std::atomic<bool>                        cancelled_{false};

  mutable std::mutex              mutex_;
  mutable std::condition_variable cv_;
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

} // namespace reel::util
