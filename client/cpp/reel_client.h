#pragma once

#include <arrow/result.h>
#include <arrow/status.h>
#include <grpcpp/channel.h>
#include <grpcpp/support/sync_stream.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "internal/progress/snapshot_cache.hpp"
#include "reel/orchestrator/v1.hpp"
#include "reel/orchestrator/v1/generation_service.grpc.pb.h"

namespace reel::client {

class ReelClient {
 public:
  struct Options {
    // Minimum spacing between status polls for the same task.
    std::chrono::milliseconds poll_interval{2000};
    std::chrono::milliseconds terminal_cache_ttl{300000};
    // Stream reconnects before Watch falls back to polling.
    std::uint32_t max_stream_reconnects = 5;
  };

  // Returns false to stop watching.
  using EventCallback = std::function<bool(const reel::orchestrator::v1::ProgressEvent&)>;

  explicit ReelClient(std::shared_ptr<::grpc::Channel> channel);
  ReelClient(std::shared_ptr<::grpc::Channel> channel, Options options);

  arrow::Result<std::string> Submit(const std::string& owner_id, const std::string& prompt,
                                    const reel::orchestrator::v1::TaskConfig& config) const;

  // Served from the local snapshot cache when the cached snapshot is fresh.
  arrow::Result<reel::orchestrator::v1::ProgressEvent> GetStatus(const std::string& task_id) const;

  arrow::Result<reel::orchestrator::v1::ProgressEvent> Cancel(const std::string& task_id) const;

  arrow::Result<std::vector<reel::orchestrator::v1::ProgressEvent>> ListTasks(const std::string& owner_id) const;

  arrow::Result<reel::orchestrator::v1::StatsResponse> Stats() const;

  // Delivers snapshots until the task is terminal or callback returns false.
  // Uses the push stream and resubscribes when it breaks; falls back to
  // polling GetStatus if streaming is unavailable.
  arrow::Status Watch(const std::string& task_id, const EventCallback& callback) const;

  std::unique_ptr<::grpc::ClientReader<reel::orchestrator::v1::ProgressEvent>> WatchTask(
      const reel::orchestrator::v1::WatchTaskRequest& request, ::grpc::ClientContext* context) const;

  std::unique_ptr<::grpc::ClientReader<reel::orchestrator::v1::ProgressEvent>> WatchUser(
      const reel::orchestrator::v1::WatchUserRequest& request, ::grpc::ClientContext* context) const;

 private:
  arrow::Status Poll(const std::string& task_id, const EventCallback& callback) const;

  Options                                                          options_;
  std::unique_ptr<reel::orchestrator::v1::GenerationService::Stub> stub_;
  mutable reel::progress::SnapshotCache                            cache_;
};

} // namespace reel::client
