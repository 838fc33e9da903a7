#pragma once

#include <memory>

namespace reel::core { class TaskStore; }
namespace reel::progress { class ProgressBus; }
namespace reel::runner { class TaskRunner; class TaskScheduler; class CancellationRegistry; }

namespace reel::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<reel::core::TaskStore> store;
  std::shared_ptr<reel::progress::ProgressBus> bus;
  std::shared_ptr<reel::runner::TaskRunner> runner;
  std::shared_ptr<reel::runner::TaskScheduler> scheduler;
  std::shared_ptr<reel::runner::CancellationRegistry> cancellations;
};

} // namespace reel::service
