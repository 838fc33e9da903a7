#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

#include "internal/progress/progress_bus.hpp"

namespace reel::grpc {

/*
  Bounded hand-off between the publishing thread and a streaming RPC.

  Deliver never blocks. When the writer falls more than max_depth events
  behind, the channel closes itself and the bus drops the subscription; the
  RPC then ends with RESOURCE_EXHAUSTED and the client resubscribes, which
  resynchronizes it from the current snapshot.
*/
class QueueSubscriber final : public progress::Subscriber {
 public:
  explicit QueueSubscriber(std::size_t max_depth);

  bool Deliver(const orchestrator::v1::ProgressEvent& event) override;

  // Waits up to timeout for the next event. Returns nullopt on timeout or
  // once the channel is closed and drained.
  std::optional<orchestrator::v1::ProgressEvent> Next(std::chrono::milliseconds timeout);

  void Close();

  bool Overflowed() const;

 private:
  const std::size_t max_depth_;

  mutable std::mutex                          mutex_;
  std::condition_variable                     cv_;
  std::deque<orchestrator::v1::ProgressEvent> queue_;
  bool                                        closed_     = false;
  bool                                        overflowed_ = false;
};

} // namespace reel::grpc
