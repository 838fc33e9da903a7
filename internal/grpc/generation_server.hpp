#pragma once

#include <chrono>
#include <cstddef>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/generation_service.hpp"
#include "reel/orchestrator/v1.hpp"
#include "reel/orchestrator/v1/generation_service.grpc.pb.h"

namespace reel::grpc {

class GenerationServer final : public reel::orchestrator::v1::GenerationService::Service {
 public:
  GenerationServer(std::shared_ptr<reel::service::GenerationService> svc, std::size_t subscriber_queue_depth);

  ::grpc::Status Submit(::grpc::ServerContext*,
                        const reel::orchestrator::v1::SubmitRequest*,
                        reel::orchestrator::v1::SubmitResponse*) override;

  ::grpc::Status GetStatus(::grpc::ServerContext*,
                           const reel::orchestrator::v1::GetStatusRequest*,
                           reel::orchestrator::v1::ProgressEvent*) override;

  ::grpc::Status Cancel(::grpc::ServerContext*,
                        const reel::orchestrator::v1::CancelRequest*,
                        reel::orchestrator::v1::ProgressEvent*) override;

  ::grpc::Status ListTasks(::grpc::ServerContext*,
                           const reel::orchestrator::v1::ListTasksRequest*,
                           reel::orchestrator::v1::ListTasksResponse*) override;

  // Ends with OK after the terminal event has been written.
  ::grpc::Status WatchTask(::grpc::ServerContext*,
                           const reel::orchestrator::v1::WatchTaskRequest*,
                           ::grpc::ServerWriter<reel::orchestrator::v1::ProgressEvent>*) override;

  // Runs until the client goes away.
  ::grpc::Status WatchUser(::grpc::ServerContext*,
                           const reel::orchestrator::v1::WatchUserRequest*,
                           ::grpc::ServerWriter<reel::orchestrator::v1::ProgressEvent>*) override;

  ::grpc::Status Connect(::grpc::ServerContext*,
                         ::grpc::ServerReaderWriter<reel::orchestrator::v1::ProgressEvent,
                                                    reel::orchestrator::v1::ClientMessage>*) override;

  ::grpc::Status Stats(::grpc::ServerContext*,
                       const reel::orchestrator::v1::StatsRequest*,
                       reel::orchestrator::v1::StatsResponse*) override;

 private:
  static constexpr std::chrono::milliseconds kWriterTick{500};

  std::shared_ptr<reel::service::GenerationService> service_;
  std::size_t                                       queue_depth_;
};

} // namespace reel::grpc
