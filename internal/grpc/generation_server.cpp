#include "generation_server.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_set>
#include <vector>

#include "grpc_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/progress/progress_event.hpp"
#include "stream_subscriber.hpp"

namespace reel::grpc {

using namespace reel::orchestrator::v1;

namespace {

::grpc::Status OverflowStatus() {
  return {::grpc::StatusCode::RESOURCE_EXHAUSTED, "progress stream fell behind; resubscribe to resync"};
}

} // namespace

GenerationServer::GenerationServer(std::shared_ptr<reel::service::GenerationService> svc, std::size_t subscriber_queue_depth)
    : service_(std::move(svc)), queue_depth_(subscriber_queue_depth) {
}

::grpc::Status GenerationServer::Submit(::grpc::ServerContext*, const SubmitRequest* req, SubmitResponse* resp) {
  try {
    *resp = service_->Submit(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status GenerationServer::GetStatus(::grpc::ServerContext*, const GetStatusRequest* req, ProgressEvent* resp) {
  try {
    *resp = service_->GetStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status GenerationServer::Cancel(::grpc::ServerContext*, const CancelRequest* req, ProgressEvent* resp) {
  try {
    *resp = service_->Cancel(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status GenerationServer::ListTasks(::grpc::ServerContext*, const ListTasksRequest* req, ListTasksResponse* resp) {
  try {
    *resp = service_->ListTasks(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status GenerationServer::WatchTask(::grpc::ServerContext* ctx, const WatchTaskRequest* req,
                                           ::grpc::ServerWriter<ProgressEvent>* writer) {
  auto                   queue = std::make_shared<QueueSubscriber>(queue_depth_);
  progress::Subscription subscription;
  try {
    subscription = service_->SubscribeTask(req->task_id(), queue);
  } catch (const std::exception& e) {
    return ToStatus(e);
  }

  while (!ctx->IsCancelled()) {
    auto event = queue->Next(kWriterTick);
    if (!event) {
      if (queue->Overflowed()) {
        return OverflowStatus();
      }
      service_->Touch(subscription);
      continue;
    }

    service_->Touch(subscription);
    if (!writer->Write(*event)) {
      break;
    }
    if (progress::IsTerminalEvent(*event)) {
      return ::grpc::Status::OK;
    }
  }

  return {::grpc::StatusCode::CANCELLED, "watch cancelled by client"};
}

::grpc::Status GenerationServer::WatchUser(::grpc::ServerContext* ctx, const WatchUserRequest* req,
                                           ::grpc::ServerWriter<ProgressEvent>* writer) {
  auto                   queue = std::make_shared<QueueSubscriber>(queue_depth_);
  progress::Subscription subscription;
  try {
    subscription = service_->SubscribeUser(req->owner_id(), queue);
  } catch (const std::exception& e) {
    return ToStatus(e);
  }

  while (!ctx->IsCancelled()) {
    auto event = queue->Next(kWriterTick);
    service_->Touch(subscription);
    if (!event) {
      if (queue->Overflowed()) {
        return OverflowStatus();
      }
      continue;
    }
    if (!writer->Write(*event)) {
      break;
    }
  }

  return {::grpc::StatusCode::CANCELLED, "watch cancelled by client"};
}

::grpc::Status GenerationServer::Connect(::grpc::ServerContext*                                         ctx,
                                         ::grpc::ServerReaderWriter<ProgressEvent, ClientMessage>* stream) {
  auto queue = std::make_shared<QueueSubscriber>(queue_depth_);

  // Shared between the reader thread and the writer loop below.
  std::mutex                          mu;
  std::vector<progress::Subscription> subscriptions;
  std::unordered_set<std::string>     open_tasks;
  bool                                reader_done = false;
  std::optional<::grpc::Status>       failure;

  std::thread reader([&] {
    ClientMessage msg;
    while (stream->Read(&msg)) {
      std::string task_id;
      try {
        if (msg.has_task_id()) {
          task_id = msg.task_id();
        } else {
          SubmitRequest submit;
          submit.set_owner_id(msg.owner_id());
          submit.set_prompt(msg.prompt());
          *submit.mutable_config() = msg.config();
          task_id                  = service_->Submit(submit).task_id();
        }

        {
          std::lock_guard lock(mu);
          open_tasks.insert(task_id);
        }
        auto subscription = service_->SubscribeTask(task_id, queue);

        std::lock_guard lock(mu);
        subscriptions.push_back(std::move(subscription));
      } catch (const std::exception& e) {
        std::lock_guard lock(mu);
        open_tasks.erase(task_id);
        failure = ToStatus(e);
        break;
      }
    }

    std::lock_guard lock(mu);
    reader_done = true;
  });

  ::grpc::Status result = ::grpc::Status::OK;
  while (true) {
    if (ctx->IsCancelled()) {
      result = {::grpc::StatusCode::CANCELLED, "connection closed by client"};
      break;
    }

    auto event = queue->Next(kWriterTick);
    if (event) {
      if (!stream->Write(*event)) {
        result = {::grpc::StatusCode::CANCELLED, "connection closed by client"};
        break;
      }
    } else if (queue->Overflowed()) {
      result = OverflowStatus();
      break;
    }

    std::lock_guard lock(mu);
    for (const auto& subscription : subscriptions) {
      service_->Touch(subscription);
    }
    if (event && progress::IsTerminalEvent(*event)) {
      open_tasks.erase(event->task_id());
    }
    if (failure) {
      result = *failure;
      break;
    }
    if (reader_done && open_tasks.empty()) {
      break;
    }
  }

  bool join_pending = false;
  {
    std::lock_guard lock(mu);
    join_pending = !reader_done;
  }
  if (join_pending) {
    // Unblocks the pending Read.
    ctx->TryCancel();
  }
  reader.join();

  queue->Close();
  subscriptions.clear();

  REEL_LOG_DEBUG("connect stream closed", {reel::observability::IntField("code", static_cast<std::int64_t>(result.error_code()))});
  return result;
}

::grpc::Status GenerationServer::Stats(::grpc::ServerContext*, const StatsRequest* req, StatsResponse* resp) {
  try {
    *resp = service_->Stats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace reel::grpc
