#include "task_scheduler.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace reel::runner {

TaskScheduler::TaskScheduler(std::size_t max_in_flight) : max_in_flight_(max_in_flight) {
  if (max_in_flight_ == 0) {
    throw util::InvalidArgument("max_in_flight must be positive");
  }
}

TaskScheduler::~TaskScheduler() {
  Stop();
}

void TaskScheduler::Start() {
  if (started_.exchange(true)) {
    return;
  }
  workers_.reserve(max_in_flight_);
  for (std::size_t i = 0; i < max_in_flight_; ++i) {
    workers_.emplace_back(&TaskScheduler::Run, this);
  }
}

void TaskScheduler::Stop() {
  queue_.Shutdown();
  for (auto& worker : workers_) {
    if (worker.joinable()) worker.join();
  }
  workers_.clear();
}

void TaskScheduler::Submit(QueuedTask task) {
  const auto task_id = task.task_id;
  if (!queue_.Enqueue(std::move(task))) {
    throw util::InvalidState("scheduler stopped; task " + task_id + " not accepted");
  }
  REEL_LOG_DEBUG("task queued", {observability::StringField("task_id", task_id),
                                 observability::IntField("queued", static_cast<std::int64_t>(queue_.Size()))});
  ReportLoad();
}

void TaskScheduler::ReportLoad() const {
  observability::Metrics::Instance().SetActiveTasks(running_.load(), queue_.Size());
}

void TaskScheduler::Run() {
  while (true) {
    auto task = queue_.Dequeue();
    if (!task)
      break;

    running_.fetch_add(1);
    ReportLoad();
    try {
      task->run();
    } catch (const std::exception& e) {
      REEL_LOG_ERROR("task worker caught unhandled error",
                     {observability::StringField("task_id", task->task_id), observability::StringField("error", e.what())});
    }
    running_.fetch_sub(1);
    ReportLoad();
  }
}

} // namespace reel::runner
