#pragma once

#include <cstdint>
#include <string>

namespace reel::db::model {

/*
  Persistent generation task row.

  Structured values (config, stage progress, error, result) are stored as
  protobuf JSON so the schema does not follow every message change.
  error_json / result_json are empty when unset.

  sequence increases with every mutation and is never reused.
*/
struct TaskRecord {
  std::string id;
  std::string owner_id;
  std::string prompt;
  std::string config_json;

  std::string status;
  std::string stage;
  std::string stage_progress_json;

  std::string message;
  std::string error_json;
  std::string result_json;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
  uint64_t sequence      = 0;
};

} // namespace reel::db::model
