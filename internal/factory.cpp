#include "factory.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "internal/core/task_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/generation_server.hpp"
#include "internal/media/ffmpeg_media_editor.hpp"
#include "internal/media/ffprobe_media_probe.hpp"
#include "internal/observability/logging.hpp"
#include "internal/progress/progress_bus.hpp"
#include "internal/providers/grpc_provider_gateway.hpp"
#include "internal/runner/cancellation_registry.hpp"
#include "internal/runner/task_scheduler.hpp"
#include "internal/runtime/retention_sweeper.hpp"
#include "internal/service/generation_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/storage/arrow_asset_store.hpp"
#include "internal/util/time.hpp"
#if REEL_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace reel::factory {

using namespace reel;

namespace {

std::shared_ptr<db::Repository> BuildRepository(const reel::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if REEL_DB_SQLITE
    db::sqlite::SqliteOptions options;
    options.path         = database.sqlite().path();
    options.busy_timeout = std::chrono::milliseconds(database.sqlite().busy_timeout_ms());
    options.synchronous  = database.sqlite().synchronous();
    auto sqlite_db       = std::make_shared<db::sqlite::SqliteDB>(std::move(options));
    db::sqlite::BootstrapSchema(*sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

core::StageWeights MakeStageWeights(const reel::runtime::config::RuntimeConfig& config) {
  const auto&        w = config.progress().stage_weights();
  core::StageWeights weights;
  weights.values = {w.analyzing_prompt(), w.generating_scenes(), w.generating_images(),
                    w.generating_audio(), w.generating_music(),  w.assembling_video()};
  return weights;
}

runner::RunnerOptions MakeRunnerOptions(const reel::runtime::config::RuntimeConfig& config) {
  runner::RunnerOptions options;

  options.retry.max_attempts    = config.retry().max_attempts();
  options.retry.initial_backoff = util::ToMillis(config.retry().initial_backoff());
  options.retry.max_backoff     = util::ToMillis(config.retry().max_backoff());
  options.retry.multiplier      = config.retry().multiplier();

  options.scene_concurrency = config.scheduler().scene_concurrency();
  options.task_timeout      = util::ToMillis(config.scheduler().task_timeout());

  options.allocation.min_scene_duration = config.timing().min_scene_duration_s();
  options.allocation.rounding_decimals  = config.timing().rounding_decimals();
  options.transition_s                  = config.timing().transition_s();
  return options;
}

timing::AdjustPolicy MakeAdjustPolicy(const reel::runtime::config::RuntimeConfig& config) {
  timing::AdjustPolicy policy;
  policy.epsilon                  = config.timing().duration_epsilon_s();
  policy.max_corrective_passes    = config.timing().max_corrective_passes();
  policy.probe_retry              = MakeRunnerOptions(config).retry;
  policy.probe_retry.max_attempts = config.timing().probe_attempts();
  return policy;
}

/*
    Build full application dependency graph
*/
Application Build(const reel::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence and assets
  // ------------------------------------------------------------------
  auto repository = BuildRepository(config);
  auto assets     = std::make_shared<storage::ArrowAssetStore>(config.storage().root(), config.storage().fsync());

  app.store = std::make_shared<core::TaskStore>(repository, core::TaskLifecycle(MakeStageWeights(config)));
  const auto hydrated = app.store->Hydrate();

  app.bus = std::make_shared<progress::ProgressBus>(app.store);

  // ------------------------------------------------------------------
  // External collaborators
  // ------------------------------------------------------------------
  auto channel   = ::grpc::CreateChannel(config.providers().endpoint(), ::grpc::InsecureChannelCredentials());
  auto providers = std::make_shared<providers::GrpcProviderGateway>(channel, assets, util::ToMillis(config.providers().call_timeout()));

  auto probe  = std::make_shared<media::FfprobeMediaProbe>(assets, config.media().ffprobe_path());
  auto editor = std::make_shared<media::FfmpegMediaEditor>(assets, config.media().ffmpeg_path(), config.media().scratch_dir());

  auto adjuster = std::make_shared<timing::DurationAdjuster>(probe, editor, assets, MakeAdjustPolicy(config));

  // ------------------------------------------------------------------
  // Execution
  // ------------------------------------------------------------------
  auto cancellations = std::make_shared<runner::CancellationRegistry>();
  auto runner = std::make_shared<runner::TaskRunner>(app.store, app.bus, providers, adjuster, editor, assets, cancellations,
                                                     MakeRunnerOptions(config));

  app.scheduler = std::make_shared<runner::TaskScheduler>(config.scheduler().max_in_flight_tasks());
  app.scheduler->Start();

  runtime::RetentionOptions retention;
  retention.max_task_age              = util::ToMillis(config.retention().max_task_age());
  retention.sweep_interval            = util::ToMillis(config.retention().sweep_interval());
  retention.idle_subscription_timeout = util::ToMillis(config.progress().idle_subscription_timeout());
  app.sweeper = std::make_shared<runtime::RetentionSweeper>(app.store, app.bus, retention);
  app.sweeper->Start();

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.store         = app.store;
  ctx.bus           = app.bus;
  ctx.runner        = runner;
  ctx.scheduler     = app.scheduler;
  ctx.cancellations = cancellations;

  app.generation_service = std::make_shared<service::GenerationService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(
      std::make_unique<grpc::GenerationServer>(app.generation_service, config.progress().subscriber_queue_depth()));

  REEL_LOG_INFO("runtime built", {reel::observability::IntField("hydrated_tasks", static_cast<std::int64_t>(hydrated)),
                                  reel::observability::StringField("provider_endpoint", config.providers().endpoint()),
                                  reel::observability::BoolField("sqlite", config.database().has_sqlite())});
  return app;
}

void Application::Shutdown() {
  if (sweeper) sweeper->Stop();
  // Blocks until queued and running tasks reach a terminal state.
  if (scheduler) scheduler->Stop();
}

} // namespace reel::factory
