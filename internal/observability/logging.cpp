#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <string>
#include <utility>

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace reel::observability {
namespace {

std::string ResolveLevel(const reel::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("REEL_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "info";
}

std::string ResolvePattern(const reel::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("REEL_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

bool ResolveTraceContextEnabled(const reel::runtime::config::RuntimeConfig& config) {
  if (const char* include_trace = std::getenv("REEL_LOG_INCLUDE_TRACE_CONTEXT")) {
    return std::string(include_trace) == "1" || std::string(include_trace) == "true";
  }
  return config.logging().include_trace_context();
}

bool g_include_trace_context{false};

thread_local TaskContext t_context;

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) {
    return true;
  }
  return value.find_first_of(" \t\n\"=") != std::string_view::npos;
}

void AppendField(std::string& out, std::string_view key, std::string_view value) {
  if (!out.empty()) {
    out.push_back(' ');
  }
  out.append(key);
  out.push_back('=');
  if (!NeedsQuoting(value)) {
    out.append(value);
    return;
  }
  out.push_back('"');
  for (const char c : value) {
    if (c == '"' || c == '\\') {
      out.push_back('\\');
      out.push_back(c);
    } else if (c == '\n') {
      out.append("\\n");
    } else {
      out.push_back(c);
    }
  }
  out.push_back('"');
}

bool HasKey(std::initializer_list<LogField> fields, std::string_view key) {
  for (const auto& field : fields) {
    if (field.key == key) {
      return true;
    }
  }
  return false;
}

std::string ContextFields(std::initializer_list<LogField> fields) {
  std::string out;
  if (!t_context.task_id.empty() && !HasKey(fields, "task_id")) {
    AppendField(out, "task_id", t_context.task_id);
  }
  if (!t_context.stage.empty() && !HasKey(fields, "stage")) {
    AppendField(out, "stage", t_context.stage);
  }
  if (t_context.scene >= 0 && !HasKey(fields, "scene")) {
    AppendField(out, "scene", std::to_string(t_context.scene));
  }
  return out;
}

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

std::string TraceContextFields() {
  if (!g_include_trace_context) {
    return {};
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return {};
  }

  auto context = span->GetContext();
  if (!context.IsValid()) {
    return {};
  }

  auto trace_id = context.trace_id();
  auto span_id  = context.span_id();
  if (trace_id.IsValid() && span_id.IsValid()) {
    uint8_t trace_bytes[16];
    uint8_t span_bytes[8];
    trace_id.CopyBytesTo(trace_bytes);
    span_id.CopyBytesTo(span_bytes);
    return "trace_id=" + HexId(trace_bytes, 16) + " span_id=" + HexId(span_bytes, 8);
  }
  return {};
}
#else
std::string TraceContextFields() {
  return {};
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField DoubleField(std::string_view key, double value) {
  return {std::string(key), fmt::format("{:.3f}", value)};
}

void InitializeLogging(const reel::runtime::config::RuntimeConfig& config) {
  spdlog::drop("reel-orchestrator");
  auto logger = spdlog::stdout_color_mt("reel-orchestrator");
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(spdlog::level::from_str(ResolveLevel(config)));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context = ResolveTraceContextEnabled(config);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

TaskLogScope::TaskLogScope(std::string_view task_id, std::string_view stage, std::int64_t scene) : saved_(t_context) {
  if (!task_id.empty()) {
    t_context.task_id = std::string(task_id);
  }
  t_context.stage = std::string(stage);
  t_context.scene = scene;
}

TaskLogScope::~TaskLogScope() {
  t_context = std::move(saved_);
}

void TaskLogScope::SetStage(std::string_view stage) {
  t_context.stage = std::string(stage);
}

TaskContext CurrentTaskContext() {
  return t_context;
}

std::string FormatFields(std::initializer_list<LogField> fields) {
  std::string out = ContextFields(fields);
  for (const auto& field : fields) {
    AppendField(out, field.key, field.value);
  }
  return out;
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto line = FormatFields(fields);
  if (auto trace_fields = TraceContextFields(); !trace_fields.empty()) {
    if (!line.empty()) {
      line.push_back(' ');
    }
    line += trace_fields;
  }

  if (line.empty()) {
    spdlog::log(level, "{}", message);
    return;
  }
  spdlog::log(level, "{} {}", message, line);
}

} // namespace reel::observability
