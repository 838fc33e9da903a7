#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace reel::config {

using reel::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  RuntimeConfig config;
  if (yaml.IsNull()) {
    ApplyDefaults(config);
    Validate(config);
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(config);
  Validate(config);
  return config;
}

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

namespace {

void DefaultSeconds(google::protobuf::Duration* duration, int64_t seconds) {
  if (duration->seconds() == 0 && duration->nanos() == 0) {
    duration->set_seconds(seconds);
  }
}

} // namespace

void ApplyDefaults(RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) server->set_bind_address("0.0.0.0:50051");
  if (server->max_message_bytes() == 0) server->set_max_message_bytes(4 * 1024 * 1024);

  if (config.database().backend_case() == reel::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config.mutable_database()->mutable_memory();
  }
  if (config.database().has_sqlite()) {
    auto* sqlite = config.mutable_database()->mutable_sqlite();
    if (sqlite->busy_timeout_ms() == 0) sqlite->set_busy_timeout_ms(5000);
    if (sqlite->synchronous().empty()) sqlite->set_synchronous("NORMAL");
  }

  auto* storage = config.mutable_storage();
  if (storage->root().empty()) storage->set_root("./data/assets");

  auto* scheduler = config.mutable_scheduler();
  if (scheduler->max_in_flight_tasks() == 0) scheduler->set_max_in_flight_tasks(5);
  if (scheduler->scene_concurrency() == 0) scheduler->set_scene_concurrency(3);
  DefaultSeconds(scheduler->mutable_task_timeout(), 3600);

  auto* retry = config.mutable_retry();
  if (retry->max_attempts() == 0) retry->set_max_attempts(3);
  DefaultSeconds(retry->mutable_initial_backoff(), 1);
  DefaultSeconds(retry->mutable_max_backoff(), 30);
  if (retry->multiplier() == 0.0) retry->set_multiplier(2.0);

  auto* timing = config.mutable_timing();
  if (timing->min_scene_duration_s() == 0.0) timing->set_min_scene_duration_s(3.0);
  if (timing->duration_epsilon_s() == 0.0) timing->set_duration_epsilon_s(0.05);
  if (timing->rounding_decimals() == 0) timing->set_rounding_decimals(2);
  if (timing->max_corrective_passes() == 0) timing->set_max_corrective_passes(3);
  if (timing->probe_attempts() == 0) timing->set_probe_attempts(3);

  auto* progress = config.mutable_progress();
  auto* weights  = progress->mutable_stage_weights();
  if (weights->analyzing_prompt() + weights->generating_scenes() + weights->generating_images() + weights->generating_audio() +
          weights->generating_music() + weights->assembling_video() ==
      0) {
    weights->set_analyzing_prompt(5);
    weights->set_generating_scenes(10);
    weights->set_generating_images(25);
    weights->set_generating_audio(20);
    weights->set_generating_music(10);
    weights->set_assembling_video(30);
  }
  DefaultSeconds(progress->mutable_poll_interval(), 2);
  DefaultSeconds(progress->mutable_terminal_cache_ttl(), 300);
  DefaultSeconds(progress->mutable_idle_subscription_timeout(), 600);
  if (progress->subscriber_queue_depth() == 0) progress->set_subscriber_queue_depth(64);

  auto* providers = config.mutable_providers();
  if (providers->endpoint().empty()) providers->set_endpoint("localhost:50061");
  DefaultSeconds(providers->mutable_call_timeout(), 300);

  auto* media = config.mutable_media();
  if (media->ffmpeg_path().empty()) media->set_ffmpeg_path("ffmpeg");
  if (media->ffprobe_path().empty()) media->set_ffprobe_path("ffprobe");

  auto* retention = config.mutable_retention();
  DefaultSeconds(retention->mutable_max_task_age(), 168 * 3600);
  DefaultSeconds(retention->mutable_sweep_interval(), 3600);

  auto* logging = config.mutable_logging();
  if (logging->level().empty()) logging->set_level("info");
}

void Validate(const RuntimeConfig& config) {
  const auto& w     = config.progress().stage_weights();
  const auto  total = w.analyzing_prompt() + w.generating_scenes() + w.generating_images() + w.generating_audio() + w.generating_music() +
                     w.assembling_video();
  if (total != 100) {
    throw std::runtime_error("Invalid configuration: progress.stage_weights must sum to 100, got " + std::to_string(total));
  }
  if (config.scheduler().max_in_flight_tasks() == 0) {
    throw std::runtime_error("Invalid configuration: scheduler.max_in_flight_tasks must be positive");
  }
  if (config.scheduler().scene_concurrency() == 0) {
    throw std::runtime_error("Invalid configuration: scheduler.scene_concurrency must be positive");
  }
  if (config.retry().max_attempts() < 1) {
    throw std::runtime_error("Invalid configuration: retry.max_attempts must be at least 1");
  }
  if (config.retry().multiplier() < 1.0) {
    throw std::runtime_error("Invalid configuration: retry.multiplier must be at least 1.0");
  }
  if (config.timing().min_scene_duration_s() < 0.0) {
    throw std::runtime_error("Invalid configuration: timing.min_scene_duration_s must be non-negative");
  }
  if (config.timing().transition_s() < 0.0) {
    throw std::runtime_error("Invalid configuration: timing.transition_s must be non-negative");
  }
  if (config.timing().duration_epsilon_s() <= 0.0) {
    throw std::runtime_error("Invalid configuration: timing.duration_epsilon_s must be positive");
  }
  if (config.observability().has_trace_sample_ratio()) {
    const double ratio = config.observability().trace_sample_ratio();
    if (!(ratio >= 0.0 && ratio <= 1.0)) {
      throw std::runtime_error("Invalid configuration: observability.trace_sample_ratio must be within [0, 1]");
    }
  }
  if (config.progress().subscriber_queue_depth() == 0) {
    throw std::runtime_error("Invalid configuration: progress.subscriber_queue_depth must be positive");
  }
  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
  if (config.database().has_sqlite()) {
    const auto& mode = config.database().sqlite().synchronous();
    if (mode != "OFF" && mode != "NORMAL" && mode != "FULL" && mode != "EXTRA") {
      throw std::runtime_error("Invalid configuration: database.sqlite.synchronous must be OFF, NORMAL, FULL or EXTRA");
    }
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& document) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(document);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

} // namespace reel::config
