#pragma once

#include <memory>
#include <string>

#include "internal/progress/progress_bus.hpp"
#include "reel/orchestrator/v1.hpp"
#include "service_context.hpp"

namespace reel::service {

/*
  GenerationService

  Transport independent entry point for clients. Submit only records the
  task and queues it; the scheduler runs it when a slot frees up.

  GetStatus is the pull path. Push observers attach through SubscribeTask /
  SubscribeUser and receive the same snapshots.
*/
class GenerationService {
 public:
  explicit GenerationService(ServiceContext ctx);

  // Throws util::InvalidArgument for an empty prompt / owner or a
  // non-positive total duration.
  orchestrator::v1::SubmitResponse Submit(const orchestrator::v1::SubmitRequest& req);

  orchestrator::v1::ProgressEvent GetStatus(const orchestrator::v1::GetStatusRequest& req);

  // Throws util::NotFound for unknown tasks and util::InvalidState once the
  // task is terminal.
  orchestrator::v1::ProgressEvent Cancel(const orchestrator::v1::CancelRequest& req);

  orchestrator::v1::ListTasksResponse ListTasks(const orchestrator::v1::ListTasksRequest& req);

  progress::Subscription SubscribeTask(const std::string& task_id, std::shared_ptr<progress::Subscriber> subscriber);
  progress::Subscription SubscribeUser(const std::string& owner_id, std::shared_ptr<progress::Subscriber> subscriber);

  // Keeps a push subscription alive while its channel is open.
  void Touch(const progress::Subscription& subscription);

  orchestrator::v1::StatsResponse Stats(const orchestrator::v1::StatsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace reel::service
