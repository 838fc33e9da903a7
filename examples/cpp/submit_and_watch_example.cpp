#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

#include "client/cpp/reel_client.h"
#include "reel/orchestrator/v1.hpp"

int main(int argc, char** argv) {
  // Allow overriding the service endpoint for remote or containerized runs.
  const std::string target = argc > 1 ? argv[1] : "localhost:50051";
  const std::string prompt = argc > 2 ? argv[2] : "A sunrise over a quiet harbor, told in four scenes";

  reel::client::ReelClient client(grpc::CreateChannel(target, grpc::InsecureChannelCredentials()));

  reel::orchestrator::v1::TaskConfig config;
  config.set_aspect_ratio("9:16");
  config.set_total_duration_s(24.0);
  config.set_style("cinematic");

  auto task_id = client.Submit("example-user", prompt, config);
  if (!task_id.ok()) {
    std::cerr << "Submit failed: " << task_id.status().ToString() << '\n';
    return 1;
  }
  std::cout << "submitted task " << *task_id << '\n';

  // Watch prints one line per snapshot until the task is terminal.
  reel::orchestrator::v1::ProgressEvent last;
  auto status = client.Watch(*task_id, [&](const reel::orchestrator::v1::ProgressEvent& event) {
    std::cout << std::setw(3) << event.overall_progress() << "% " << event.status();
    if (event.has_message()) {
      std::cout << " (" << event.message() << ")";
    }
    std::cout << '\n';
    last = event;
    return true;
  });
  if (!status.ok()) {
    std::cerr << "Watch failed: " << status.ToString() << '\n';
    return 1;
  }

  if (last.status() != "completed") {
    std::cerr << "task ended " << last.status() << ": " << last.error().kind() << " " << last.error().message() << '\n';
    return 2;
  }

  std::cout << "video " << last.result().video_ref() << " (" << last.result().duration_s() << "s)\n";
  return 0;
}
