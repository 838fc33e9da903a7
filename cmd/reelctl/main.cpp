#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "client/cpp/reel_client.h"
#include "internal/progress/progress_event.hpp"
#include "reel/orchestrator/v1.hpp"

using namespace reel::orchestrator::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  reelctl <addr> submit <owner_id> <prompt> [total_duration_s] [aspect_ratio] [style]\n"
            << "  reelctl <addr> status <task_id>\n"
            << "  reelctl <addr> cancel <task_id>\n"
            << "  reelctl <addr> list <owner_id>\n"
            << "  reelctl <addr> watch <task_id>\n"
            << "  reelctl <addr> stats\n";
}

static int Fail(const arrow::Status& status) {
  std::cerr << status.ToString() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  reel::client::ReelClient client(grpc::CreateChannel(addr, grpc::InsecureChannelCredentials()));

  // ------------------------------------------------------------

  if (cmd == "submit") {
    if (argc < 5) return 1;

    TaskConfig config;
    config.set_total_duration_s(argc >= 6 ? std::strtod(argv[5], nullptr) : 30.0);
    config.set_aspect_ratio(argc >= 7 ? argv[6] : "16:9");
    if (argc >= 8) config.set_style(argv[7]);

    auto task_id = client.Submit(argv[3], argv[4], config);
    if (!task_id.ok()) return Fail(task_id.status());

    std::cout << "task_id=" << *task_id << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "status" || cmd == "cancel") {
    if (argc < 4) return 1;

    auto event = cmd == "status" ? client.GetStatus(argv[3]) : client.Cancel(argv[3]);
    if (!event.ok()) return Fail(event.status());

    std::cout << reel::progress::ToJson(*event) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    if (argc < 4) return 1;

    auto tasks = client.ListTasks(argv[3]);
    if (!tasks.ok()) return Fail(tasks.status());

    for (const auto& event : *tasks) {
      std::cout << reel::progress::ToJson(event) << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "watch") {
    if (argc < 4) return 1;

    ProgressEvent last;
    auto          status = client.Watch(argv[3], [&](const ProgressEvent& event) {
      std::cout << reel::progress::ToJson(event) << std::endl;
      last = event;
      return true;
    });
    if (!status.ok()) return Fail(status);

    return last.status() == "completed" ? 0 : 3;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    auto stats = client.Stats();
    if (!stats.ok()) return Fail(stats.status());

    std::cout << "task_subscriptions=" << stats->task_subscriptions() << "\n"
              << "user_subscriptions=" << stats->user_subscriptions() << "\n"
              << "events_delivered=" << stats->events_delivered() << "\n"
              << "events_dropped=" << stats->events_dropped() << "\n"
              << "running_tasks=" << stats->running_tasks() << "\n"
              << "queued_tasks=" << stats->queued_tasks() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
