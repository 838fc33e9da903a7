#include "client/cpp/reel_client.h"

#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>
#include <grpcpp/security/server_credentials.h>
#include <grpcpp/server_builder.h>

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/grpc/generation_server.hpp"
#include "internal/progress/progress_event.hpp"
#include "tests/support/service_harness.hpp"

namespace {

using reel::client::ReelClient;
using reel::orchestrator::v1::ProgressEvent;
using reel::testing::ServiceHarness;

// In-process server on an ephemeral loopback port.
struct Endpoint {
  ServiceHarness                                harness;
  std::unique_ptr<reel::grpc::GenerationServer> server;
  std::unique_ptr<::grpc::Server>               grpc_server;
  std::shared_ptr<::grpc::Channel>              channel;

  explicit Endpoint(reel::testing::FakeProviders::Script script = {}) : harness(script) {
    server = std::make_unique<reel::grpc::GenerationServer>(harness.service, 64);

    int                   port = 0;
    ::grpc::ServerBuilder builder;
    builder.AddListeningPort("127.0.0.1:0", ::grpc::InsecureServerCredentials(), &port);
    builder.RegisterService(server.get());
    grpc_server = builder.BuildAndStart();
    assert(grpc_server);
    assert(port > 0);

    channel = ::grpc::CreateChannel("127.0.0.1:" + std::to_string(port), ::grpc::InsecureChannelCredentials());
  }

  ~Endpoint() {
    grpc_server->Shutdown();
    harness.Stop();
  }
};

reel::orchestrator::v1::TaskConfig Config(double total = 12.0) {
  reel::orchestrator::v1::TaskConfig config;
  config.set_total_duration_s(total);
  config.set_aspect_ratio("16:9");
  return config;
}

void TestSubmitAndWatchToCompletion() {
  Endpoint   endpoint;
  ReelClient client(endpoint.channel);

  const auto submitted = client.Submit("alice", "a lighthouse at dawn", Config());
  assert(submitted.ok());
  const auto task_id = *submitted;

  std::vector<ProgressEvent> events;
  const auto                 status = client.Watch(task_id, [&](const ProgressEvent& event) {
    events.push_back(event);
    return true;
  });
  assert(status.ok());
  assert(!events.empty());
  assert(events.back().status() == "completed");
  for (std::size_t i = 1; i < events.size(); ++i) {
    assert(events[i].sequence() > events[i - 1].sequence());
  }

  const auto final_status = client.GetStatus(task_id);
  assert(final_status.ok());
  assert(final_status->status() == "completed");
  assert(final_status->overall_progress() == 100);

  const auto listed = client.ListTasks("alice");
  assert(listed.ok());
  assert(listed->size() == 1);
}

void TestErrorsMapToArrowStatus() {
  Endpoint   endpoint;
  ReelClient client(endpoint.channel);

  const auto invalid = client.Submit("alice", "", Config());
  assert(!invalid.ok());
  assert(invalid.status().IsInvalid());

  const auto missing = client.GetStatus("no-such-task");
  assert(!missing.ok());
  assert(missing.status().IsKeyError());

  const auto cancel_missing = client.Cancel("no-such-task");
  assert(!cancel_missing.ok());
  assert(cancel_missing.status().IsKeyError());
}

void TestCancelThenCancelAgain() {
  reel::testing::FakeProviders::Script script;
  script.image_latency = std::chrono::seconds(1);

  Endpoint   endpoint(script);
  ReelClient client(endpoint.channel);

  const auto task_id = client.Submit("alice", "slow prompt", Config());
  assert(task_id.ok());

  const auto cancelled = client.Cancel(*task_id);
  assert(cancelled.ok());
  assert(cancelled->status() == "cancelled");

  const auto again = client.Cancel(*task_id);
  assert(!again.ok());
  assert(again.status().IsInvalid());

  const auto stats = client.Stats();
  assert(stats.ok());
}

void TestConnectSubmitsAndStreams() {
  Endpoint endpoint;
  auto     stub = reel::orchestrator::v1::GenerationService::NewStub(endpoint.channel);

  ::grpc::ClientContext ctx;
  auto                  stream = stub->Connect(&ctx);

  reel::orchestrator::v1::ClientMessage msg;
  msg.set_owner_id("dana");
  msg.set_prompt("two submissions over one stream");
  *msg.mutable_config() = Config();
  assert(stream->Write(msg));
  assert(stream->Write(msg));
  stream->WritesDone();

  std::vector<std::string> finished;
  ProgressEvent            event;
  while (stream->Read(&event)) {
    if (reel::progress::IsTerminalEvent(event)) {
      finished.push_back(event.task_id());
    }
  }
  const auto status = stream->Finish();
  assert(status.ok());
  assert(finished.size() == 2);
  assert(finished[0] != finished[1]);
}

void TestWatchUnknownTaskFails() {
  Endpoint   endpoint;
  ReelClient client(endpoint.channel);

  const auto status = client.Watch("no-such-task", [](const ProgressEvent&) { return true; });
  assert(!status.ok());
  assert(status.IsKeyError());
}

} // namespace

int main() {
  TestSubmitAndWatchToCompletion();
  TestErrorsMapToArrowStatus();
  TestCancelThenCancelAgain();
  TestConnectSubmitsAndStreams();
  TestWatchUnknownTaskFails();

  std::cout << "reel_unit_client: pass\n";
  return 0;
}
