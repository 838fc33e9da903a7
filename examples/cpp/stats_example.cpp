#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <iostream>
#include <memory>
#include <string>

#include "client/cpp/reel_client.h"
#include "reel/orchestrator/v1.hpp"

int main(int argc, char** argv) {
  // Allow optional endpoint override for local/remote diagnostics.
  const std::string target = argc > 1 ? argv[1] : "localhost:50051";

  reel::client::ReelClient client(grpc::CreateChannel(target, grpc::InsecureChannelCredentials()));

  // Stats reports subscription fan-out and scheduler load.
  auto result = client.Stats();
  if (!result.ok()) {
    std::cerr << "Stats RPC failed: " << result.status().ToString() << '\n';
    return 1;
  }

  const auto& stats = result.ValueOrDie();
  std::cout << "Reel orchestrator stats for " << target << '\n';
  std::cout << "tasks: running=" << stats.running_tasks() << ", queued=" << stats.queued_tasks() << '\n';
  std::cout << "subscriptions: task=" << stats.task_subscriptions() << ", user=" << stats.user_subscriptions() << '\n';
  std::cout << "events: delivered=" << stats.events_delivered() << ", dropped=" << stats.events_dropped() << '\n';

  return 0;
}
