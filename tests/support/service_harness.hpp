#pragma once

#include <chrono>
#include <memory>

#include "fake_media_tool.hpp"
#include "fake_providers.hpp"
#include "internal/core/task_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/progress/progress_bus.hpp"
#include "internal/runner/cancellation_registry.hpp"
#include "internal/runner/task_runner.hpp"
#include "internal/runner/task_scheduler.hpp"
#include "internal/service/generation_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/storage/memory_asset_store.hpp"

namespace reel::testing {

/*
  Fully wired service over the memory repository, the memory asset store and
  scripted providers. The scheduler is running; Stop() drains it.
*/
struct ServiceHarness {
  std::shared_ptr<storage::MemoryAssetStore> assets = std::make_shared<storage::MemoryAssetStore>();
  std::shared_ptr<FakeMediaTool>             media  = std::make_shared<FakeMediaTool>();
  std::shared_ptr<FakeProviders>             providers;
  service::ServiceContext                    ctx;
  std::shared_ptr<service::GenerationService> service;

  explicit ServiceHarness(FakeProviders::Script script = {}, std::size_t max_in_flight = 2) {
    providers = std::make_shared<FakeProviders>(assets, media, script);

    ctx.store = std::make_shared<core::TaskStore>(std::make_shared<db::memory::MemoryRepository>(), core::TaskLifecycle());
    ctx.bus   = std::make_shared<progress::ProgressBus>(ctx.store);
    ctx.cancellations = std::make_shared<runner::CancellationRegistry>();

    timing::AdjustPolicy policy;
    policy.probe_retry.initial_backoff = std::chrono::milliseconds(1);
    auto adjuster        = std::make_shared<timing::DurationAdjuster>(media, media, assets, policy);

    runner::RunnerOptions options;
    options.retry.initial_backoff = std::chrono::milliseconds(1);
    options.retry.max_backoff     = std::chrono::milliseconds(2);

    ctx.runner    = std::make_shared<runner::TaskRunner>(ctx.store, ctx.bus, providers, adjuster, media, assets, ctx.cancellations, options);
    ctx.scheduler = std::make_shared<runner::TaskScheduler>(max_in_flight);
    ctx.scheduler->Start();

    service = std::make_shared<service::GenerationService>(ctx);
  }

  ~ServiceHarness() {
    Stop();
  }

  void Stop() {
    ctx.scheduler->Stop();
  }

  static orchestrator::v1::SubmitRequest Request(const std::string& owner = "alice", double total = 12.0) {
    orchestrator::v1::SubmitRequest req;
    req.set_owner_id(owner);
    req.set_prompt("a lighthouse at dawn");
    req.mutable_config()->set_total_duration_s(total);
    req.mutable_config()->set_aspect_ratio("16:9");
    return req;
  }
};

} // namespace reel::testing
