#include "internal/service/generation_service.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <limits>

#include "internal/util/errors.hpp"
#include "tests/support/recording_subscriber.hpp"
#include "tests/support/service_harness.hpp"

namespace {

using namespace std::chrono_literals;
using reel::orchestrator::v1::CancelRequest;
using reel::orchestrator::v1::GetStatusRequest;
using reel::orchestrator::v1::ListTasksRequest;
using reel::orchestrator::v1::ProgressEvent;
using reel::testing::RecordingSubscriber;
using reel::testing::ServiceHarness;

template <typename Fn>
bool ThrowsInvalidArgument(Fn&& fn) {
  try {
    fn();
  } catch (const reel::util::InvalidArgument&) {
    return true;
  }
  return false;
}

bool IsTerminalEvent(const ProgressEvent& event) {
  return event.status() == "completed" || event.status() == "failed" || event.status() == "cancelled";
}

void TestSubmitValidatesInput() {
  ServiceHarness h;

  auto no_owner = ServiceHarness::Request("");
  assert(ThrowsInvalidArgument([&] { h.service->Submit(no_owner); }));

  auto no_prompt = ServiceHarness::Request();
  no_prompt.clear_prompt();
  assert(ThrowsInvalidArgument([&] { h.service->Submit(no_prompt); }));

  assert(ThrowsInvalidArgument([&] { h.service->Submit(ServiceHarness::Request("alice", 0.0)); }));
  assert(ThrowsInvalidArgument([&] { h.service->Submit(ServiceHarness::Request("alice", std::numeric_limits<double>::infinity())); }));

  auto negative_floor = ServiceHarness::Request();
  negative_floor.mutable_config()->set_min_scene_duration_s(-1.0);
  assert(ThrowsInvalidArgument([&] { h.service->Submit(negative_floor); }));

  ListTasksRequest list;
  list.set_owner_id("alice");
  assert(h.service->ListTasks(list).tasks_size() == 0);
}

void TestSubmittedTaskRunsToCompletion() {
  ServiceHarness h;
  const auto     id = h.service->Submit(ServiceHarness::Request()).task_id();
  assert(!id.empty());

  auto sub = std::make_shared<RecordingSubscriber>();
  auto s   = h.service->SubscribeTask(id, sub);
  assert(sub->WaitFor([](const std::vector<ProgressEvent>& events) { return !events.empty() && IsTerminalEvent(events.back()); }));

  GetStatusRequest req;
  req.set_task_id(id);
  const auto status = h.service->GetStatus(req);
  assert(status.status() == "completed");
  assert(status.overall_progress() == 100);
  assert(std::abs(status.result().duration_s() - 12.0) <= 0.05);

  // Pull and push agree on the final snapshot.
  assert(sub->Events().back().sequence() == status.sequence());
}

void TestCancelQueuedTask() {
  reel::testing::FakeProviders::Script script;
  script.image_latency = 1s;
  ServiceHarness h(script, 1);

  const auto first  = h.service->Submit(ServiceHarness::Request()).task_id();
  const auto second = h.service->Submit(ServiceHarness::Request()).task_id();

  CancelRequest cancel;
  cancel.set_task_id(second);
  const auto cancelled = h.service->Cancel(cancel);
  assert(cancelled.status() == "cancelled");

  // Cancelling again reports the terminal state.
  bool threw = false;
  try {
    h.service->Cancel(cancel);
  } catch (const reel::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  cancel.set_task_id(first);
  assert(h.service->Cancel(cancel).status() == "cancelled");
  h.Stop();

  assert(h.providers->Calls("analyze_prompt") <= 1);
  GetStatusRequest req;
  req.set_task_id(second);
  assert(h.service->GetStatus(req).status() == "cancelled");
}

void TestUnknownTaskIsNotFound() {
  ServiceHarness h;

  GetStatusRequest status;
  status.set_task_id("missing");
  CancelRequest cancel;
  cancel.set_task_id("missing");

  int not_found = 0;
  try {
    h.service->GetStatus(status);
  } catch (const reel::util::NotFound&) {
    ++not_found;
  }
  try {
    h.service->Cancel(cancel);
  } catch (const reel::util::NotFound&) {
    ++not_found;
  }
  try {
    h.service->SubscribeTask("missing", std::make_shared<RecordingSubscriber>());
  } catch (const reel::util::NotFound&) {
    ++not_found;
  }
  assert(not_found == 3);
}

void TestUserSubscriptionAndListing() {
  ServiceHarness h;

  assert(ThrowsInvalidArgument([&] { h.service->SubscribeUser("", std::make_shared<RecordingSubscriber>()); }));

  auto sub = std::make_shared<RecordingSubscriber>();
  auto s   = h.service->SubscribeUser("bob", sub);

  const auto a = h.service->Submit(ServiceHarness::Request("bob")).task_id();
  const auto b = h.service->Submit(ServiceHarness::Request("bob")).task_id();
  h.service->Submit(ServiceHarness::Request("carol"));

  assert(sub->WaitFor([&](const std::vector<ProgressEvent>& events) {
    int done = 0;
    for (const auto& event : events) {
      if ((event.task_id() == a || event.task_id() == b) && event.status() == "completed") ++done;
    }
    return done == 2;
  }));
  for (const auto& event : sub->Events()) {
    assert(event.task_id() == a || event.task_id() == b);
  }

  ListTasksRequest list;
  list.set_owner_id("bob");
  assert(h.service->ListTasks(list).tasks_size() == 2);

  const auto stats = h.service->Stats({});
  assert(stats.user_subscriptions() == 1);
  assert(stats.events_delivered() > 0);
}

} // namespace

int main() {
  TestSubmitValidatesInput();
  TestSubmittedTaskRunsToCompletion();
  TestCancelQueuedTask();
  TestUnknownTaskIsNotFound();
  TestUserSubscriptionAndListing();

  std::cout << "reel_unit_generation_service: pass\n";
  return 0;
}
