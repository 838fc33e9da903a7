#include "client/cpp/reel_client.h"

#include <string_view>
#include <thread>

#include <grpcpp/client_context.h>

#include "internal/progress/progress_event.hpp"

namespace reel::client {

namespace {

arrow::Status GrpcToArrow(const ::grpc::Status& status, std::string_view action) {
  if (status.ok()) {
    return arrow::Status::OK();
  }
  switch (status.error_code()) {
    case ::grpc::StatusCode::NOT_FOUND:
      return arrow::Status::KeyError(std::string(action), " failed: ", status.error_message());
    case ::grpc::StatusCode::INVALID_ARGUMENT:
    case ::grpc::StatusCode::FAILED_PRECONDITION:
      return arrow::Status::Invalid(std::string(action), " failed: ", status.error_message());
    case ::grpc::StatusCode::RESOURCE_EXHAUSTED:
      return arrow::Status::CapacityError(std::string(action), " failed: ", status.error_message());
    default:
      return arrow::Status::IOError(std::string(action), " failed: ", status.error_message());
  }
}

bool IsReconnectable(const ::grpc::Status& status) {
  return status.error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED || status.error_code() == ::grpc::StatusCode::UNAVAILABLE ||
         status.error_code() == ::grpc::StatusCode::CANCELLED;
}

} // namespace

ReelClient::ReelClient(std::shared_ptr<::grpc::Channel> channel) : ReelClient(std::move(channel), Options{}) {
}

ReelClient::ReelClient(std::shared_ptr<::grpc::Channel> channel, Options options)
    : options_(options),
      stub_(reel::orchestrator::v1::GenerationService::NewStub(channel)),
      cache_(options.poll_interval, options.terminal_cache_ttl) {
}

arrow::Result<std::string> ReelClient::Submit(const std::string& owner_id, const std::string& prompt,
                                              const reel::orchestrator::v1::TaskConfig& config) const {
  reel::orchestrator::v1::SubmitRequest request;
  request.set_owner_id(owner_id);
  request.set_prompt(prompt);
  *request.mutable_config() = config;

  reel::orchestrator::v1::SubmitResponse response;
  ::grpc::ClientContext                    ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->Submit(&ctx, request, &response), "Submit"));
  return response.task_id();
}

arrow::Result<reel::orchestrator::v1::ProgressEvent> ReelClient::GetStatus(const std::string& task_id) const {
  if (auto cached = cache_.Lookup(task_id)) {
    return *cached;
  }

  reel::orchestrator::v1::GetStatusRequest request;
  request.set_task_id(task_id);

  reel::orchestrator::v1::ProgressEvent response;
  ::grpc::ClientContext                   ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->GetStatus(&ctx, request, &response), "GetStatus"));
  cache_.Store(response);
  return response;
}

arrow::Result<reel::orchestrator::v1::ProgressEvent> ReelClient::Cancel(const std::string& task_id) const {
  reel::orchestrator::v1::CancelRequest request;
  request.set_task_id(task_id);

  reel::orchestrator::v1::ProgressEvent response;
  ::grpc::ClientContext                   ctx;

  cache_.Invalidate(task_id);
  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->Cancel(&ctx, request, &response), "Cancel"));
  cache_.Store(response);
  return response;
}

arrow::Result<std::vector<reel::orchestrator::v1::ProgressEvent>> ReelClient::ListTasks(const std::string& owner_id) const {
  reel::orchestrator::v1::ListTasksRequest request;
  request.set_owner_id(owner_id);

  reel::orchestrator::v1::ListTasksResponse response;
  ::grpc::ClientContext                       ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->ListTasks(&ctx, request, &response), "ListTasks"));
  return std::vector<reel::orchestrator::v1::ProgressEvent>(response.tasks().begin(), response.tasks().end());
}

arrow::Result<reel::orchestrator::v1::StatsResponse> ReelClient::Stats() const {
  reel::orchestrator::v1::StatsResponse response;
  ::grpc::ClientContext                   ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->Stats(&ctx, reel::orchestrator::v1::StatsRequest{}, &response), "Stats"));
  return response;
}

arrow::Status ReelClient::Watch(const std::string& task_id, const EventCallback& callback) const {
  reel::orchestrator::v1::WatchTaskRequest request;
  request.set_task_id(task_id);

  for (std::uint32_t attempt = 0; attempt <= options_.max_stream_reconnects; ++attempt) {
    ::grpc::ClientContext ctx;
    auto                reader = stub_->WatchTask(&ctx, request);

    // Every (re)subscribe starts with the current snapshot, so nothing
    // missed while disconnected needs replaying.
    reel::orchestrator::v1::ProgressEvent event;
    while (reader->Read(&event)) {
      cache_.Store(event);
      if (!callback(event)) {
        ctx.TryCancel();
        reader->Finish();
        return arrow::Status::OK();
      }
      if (reel::progress::IsTerminalEvent(event)) {
        ctx.TryCancel();
        reader->Finish();
        return arrow::Status::OK();
      }
    }

    const auto status = reader->Finish();
    if (status.error_code() == ::grpc::StatusCode::UNIMPLEMENTED) {
      break;
    }
    if (!status.ok() && !IsReconnectable(status)) {
      return GrpcToArrow(status, "WatchTask");
    }
    std::this_thread::sleep_for(options_.poll_interval);
  }

  return Poll(task_id, callback);
}

arrow::Status ReelClient::Poll(const std::string& task_id, const EventCallback& callback) const {
  std::uint64_t last_sequence = 0;
  while (true) {
    ARROW_ASSIGN_OR_RAISE(auto event, GetStatus(task_id));
    if (event.sequence() != last_sequence) {
      last_sequence = event.sequence();
      if (!callback(event)) {
        return arrow::Status::OK();
      }
    }
    if (reel::progress::IsTerminalEvent(event)) {
      return arrow::Status::OK();
    }
    std::this_thread::sleep_for(options_.poll_interval);
  }
}

std::unique_ptr<::grpc::ClientReader<reel::orchestrator::v1::ProgressEvent>> ReelClient::WatchTask(
    const reel::orchestrator::v1::WatchTaskRequest& request, ::grpc::ClientContext* context) const {
  return stub_->WatchTask(context, request);
}

std::unique_ptr<::grpc::ClientReader<reel::orchestrator::v1::ProgressEvent>> ReelClient::WatchUser(
    const reel::orchestrator::v1::WatchUserRequest& request, ::grpc::ClientContext* context) const {
  return stub_->WatchUser(context, request);
}

} // namespace reel::client
