#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace reel::runtime::config {
class RuntimeConfig;
}

namespace reel::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DoubleField(std::string_view key, double value);

void InitializeLogging(const reel::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

struct TaskContext {
  std::string  task_id;
  std::string  stage;
  std::int64_t scene = -1;
};

/*
  TaskLogScope

  Tags every line logged on the calling thread with task_id, stage and
  scene until the scope ends. Scopes nest; an inner scope inherits the
  task of the outer one when it names none. Fields passed explicitly to
  Log() win over the scope's.
*/
class TaskLogScope {
 public:
  explicit TaskLogScope(std::string_view task_id, std::string_view stage = {}, std::int64_t scene = -1);
  ~TaskLogScope();

  TaskLogScope(const TaskLogScope&)            = delete;
  TaskLogScope& operator=(const TaskLogScope&) = delete;

  void SetStage(std::string_view stage);

 private:
  TaskContext saved_;
};

// The calling thread's innermost TaskLogScope, empty outside any scope.
TaskContext CurrentTaskContext();

// The text Log() appends after the message: key=value pairs, values with
// spaces or quotes double-quoted.
std::string FormatFields(std::initializer_list<LogField> fields);

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace reel::observability

#define REEL_LOG_DEBUG(message, ...) ::reel::observability::LogDebug((message), ##__VA_ARGS__)
#define REEL_LOG_INFO(message, ...) ::reel::observability::LogInfo((message), ##__VA_ARGS__)
#define REEL_LOG_WARN(message, ...) ::reel::observability::LogWarn((message), ##__VA_ARGS__)
#define REEL_LOG_ERROR(message, ...) ::reel::observability::LogError((message), ##__VA_ARGS__)
