#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "internal/core/task_lifecycle.hpp"
#include "internal/runner/task_runner.hpp"
#include "internal/timing/duration_adjuster.hpp"

namespace reel::core { class TaskStore; }
namespace reel::progress { class ProgressBus; }
namespace reel::runner { class TaskScheduler; }
namespace reel::runtime { class RetentionSweeper; }
namespace reel::service { class GenerationService; }

namespace reel::factory {

/*
  Application

  Everything the daemon keeps alive for the lifetime of the process.
  Background workers are started by Build and stopped by Shutdown.
*/
struct Application {
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  std::shared_ptr<core::TaskStore>            store;
  std::shared_ptr<progress::ProgressBus>      bus;
  std::shared_ptr<runner::TaskScheduler>      scheduler;
  std::shared_ptr<runtime::RetentionSweeper>  sweeper;
  std::shared_ptr<service::GenerationService> generation_service;

  void Shutdown();
};

/*
  Build

  Composition root. The only place that knows concrete repository, storage,
  provider and media tool types.
*/
Application Build(const reel::runtime::config::RuntimeConfig& config);

core::StageWeights     MakeStageWeights(const reel::runtime::config::RuntimeConfig& config);
runner::RunnerOptions  MakeRunnerOptions(const reel::runtime::config::RuntimeConfig& config);
timing::AdjustPolicy   MakeAdjustPolicy(const reel::runtime::config::RuntimeConfig& config);

} // namespace reel::factory
