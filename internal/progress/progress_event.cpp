#include "progress_event.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace reel::progress {

orchestrator::v1::ProgressEvent BuildProgressEvent(const model::GenerationTask& task, int overall_progress) {
  orchestrator::v1::ProgressEvent event;
  event.set_task_id(task.id);
  event.set_status(std::string(model::ToString(task.status)));
  event.set_stage(std::string(model::ToString(task.stage)));

  auto& progress = *event.mutable_stage_progress();
  for (std::size_t i = 0; i < task.EnteredStages(); ++i) {
    progress[std::string(model::ToString(model::kPipeline[i]))] = task.stage_progress[i];
  }

  event.set_overall_progress(overall_progress);
  if (task.message) {
    event.set_message(*task.message);
  }
  if (task.error) {
    *event.mutable_error() = *task.error;
  }
  if (task.result) {
    *event.mutable_result() = *task.result;
  }
  *event.mutable_updated_at() = util::ToProto(task.updated_at);
  event.set_sequence(task.sequence);
  return event;
}

std::string ToJson(const orchestrator::v1::ProgressEvent& event) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(event, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("progress event to json: " + std::string(status.message()));
  }
  return json;
}

bool IsTerminalEvent(const orchestrator::v1::ProgressEvent& event) {
  const auto status = model::ParseTaskStatus(event.status());
  return status.has_value() && model::IsTerminal(*status);
}

} // namespace reel::progress
