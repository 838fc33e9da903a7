#include "generation_service.hpp"

#include <chrono>
#include <cmath>
#include <stdexcept>
#include <type_traits>

#include "internal/core/task_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runner/cancellation_registry.hpp"
#include "internal/runner/task_runner.hpp"
#include "internal/runner/task_scheduler.hpp"
#include "internal/util/errors.hpp"

namespace reel::service {

using namespace reel::orchestrator::v1;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, const std::string& task_id, Fn&& fn) {
  reel::observability::SpanScope span(route);
  if (!task_id.empty()) {
    span.SetAttribute("task_id", task_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto record     = [&](bool success) {
    reel::observability::Metrics::Instance().RecordRequest(route, success);
    reel::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      record(true);
      return;
    } else {
      auto result = fn();
      record(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    REEL_LOG_WARN("RPC failed", {reel::observability::StringField("route", route), reel::observability::StringField("error", ex.what()),
                                 reel::observability::StringField("task_id", task_id)});
    record(false);
    throw;
  }
}

void ValidateSubmit(const SubmitRequest& req) {
  if (req.owner_id().empty()) {
    throw util::InvalidArgument("submit: owner_id is required");
  }
  if (req.prompt().empty()) {
    throw util::InvalidArgument("submit: prompt must not be empty");
  }
  const double total = req.config().total_duration_s();
  if (!(total > 0.0) || !std::isfinite(total)) {
    throw util::InvalidArgument("submit: config.total_duration_s must be positive");
  }
  if (req.config().min_scene_duration_s() < 0.0) {
    throw util::InvalidArgument("submit: config.min_scene_duration_s must be non-negative");
  }
}

} // namespace

GenerationService::GenerationService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

SubmitResponse GenerationService::Submit(const SubmitRequest& req) {
  return ObserveRpc("GenerationService.Submit", "", [&] {
    ValidateSubmit(req);

    const auto task = ctx_.store->Create(req.owner_id(), req.prompt(), req.config());
    ctx_.bus->Publish(task.id);

    auto runner = ctx_.runner;
    ctx_.scheduler->Submit(runner::QueuedTask{task.id, [runner, id = task.id] { runner->Run(id); }});

    REEL_LOG_INFO("task submitted", {reel::observability::StringField("task_id", task.id),
                                     reel::observability::StringField("owner_id", req.owner_id()),
                                     reel::observability::DoubleField("total_duration_s", req.config().total_duration_s())});

    SubmitResponse resp;
    resp.set_task_id(task.id);
    return resp;
  });
}

ProgressEvent GenerationService::GetStatus(const GetStatusRequest& req) {
  return ObserveRpc("GenerationService.GetStatus", req.task_id(), [&] { return ctx_.bus->GetStatus(req.task_id()); });
}

ProgressEvent GenerationService::Cancel(const CancelRequest& req) {
  return ObserveRpc("GenerationService.Cancel", req.task_id(), [&] {
    const bool changed = ctx_.store->Mutate(req.task_id(), [&](model::GenerationTask& t) { ctx_.store->Lifecycle().Cancel(t); });
    if (!changed) {
      throw util::InvalidState("cancel: task " + req.task_id() + " is already " + ctx_.bus->GetStatus(req.task_id()).status());
    }

    // A queued task has no token yet; the runner sees the terminal status
    // when it picks the task up.
    ctx_.cancellations->Cancel(req.task_id());
    ctx_.bus->Publish(req.task_id());

    REEL_LOG_INFO("task cancellation requested", {reel::observability::StringField("task_id", req.task_id())});
    return ctx_.bus->GetStatus(req.task_id());
  });
}

ListTasksResponse GenerationService::ListTasks(const ListTasksRequest& req) {
  return ObserveRpc("GenerationService.ListTasks", "", [&] {
    ListTasksResponse resp;
    for (auto& event : ctx_.store->ListOwnerStatuses(req.owner_id())) {
      *resp.add_tasks() = std::move(event);
    }
    return resp;
  });
}

progress::Subscription GenerationService::SubscribeTask(const std::string& task_id, std::shared_ptr<progress::Subscriber> subscriber) {
  return ObserveRpc("GenerationService.SubscribeTask", task_id, [&] { return ctx_.bus->SubscribeTask(task_id, std::move(subscriber)); });
}

progress::Subscription GenerationService::SubscribeUser(const std::string& owner_id, std::shared_ptr<progress::Subscriber> subscriber) {
  return ObserveRpc("GenerationService.SubscribeUser", "", [&] {
    if (owner_id.empty()) {
      throw util::InvalidArgument("subscribe: owner_id is required");
    }
    return ctx_.bus->SubscribeUser(owner_id, std::move(subscriber));
  });
}

void GenerationService::Touch(const progress::Subscription& subscription) {
  ctx_.bus->Touch(subscription.Id());
}

StatsResponse GenerationService::Stats(const StatsRequest&) {
  return ObserveRpc("GenerationService.Stats", "", [&] {
    const auto bus_stats = ctx_.bus->Stats();

    StatsResponse resp;
    resp.set_task_subscriptions(bus_stats.task_subscriptions);
    resp.set_user_subscriptions(bus_stats.user_subscriptions);
    resp.set_events_delivered(bus_stats.events_delivered);
    resp.set_events_dropped(bus_stats.events_dropped);
    resp.set_running_tasks(ctx_.scheduler->Running());
    resp.set_queued_tasks(ctx_.scheduler->Queued());
    return resp;
  });
}

} // namespace reel::service
