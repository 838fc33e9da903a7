#include "task_store.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/progress/progress_event.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace reel::core {

namespace {

using model::AssetSlot;
using model::GenerationTask;
using model::Scene;

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Conflict:
      throw util::InvalidState(message);
    default:
      throw std::runtime_error(message);
  }
}

std::string ToJson(const google::protobuf::Message& message) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json);
  if (!status.ok()) {
    throw std::runtime_error("encode " + message.GetTypeName() + ": " + std::string(status.message()));
  }
  return json;
}

void FromJson(const std::string& json, google::protobuf::Message* message) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  auto status                   = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw std::runtime_error("decode " + message->GetTypeName() + ": " + std::string(status.message()));
  }
}

db::model::TaskRecord ToRecord(const GenerationTask& task) {
  db::model::TaskRecord record;
  record.id          = task.id;
  record.owner_id    = task.owner_id;
  record.prompt      = task.prompt;
  record.config_json = ToJson(task.config);
  record.status      = std::string(model::ToString(task.status));
  record.stage       = std::string(model::ToString(task.stage));

  google::protobuf::Struct progress;
  for (std::size_t i = 0; i < task.EnteredStages(); ++i) {
    (*progress.mutable_fields())[std::string(model::ToString(model::kPipeline[i]))].set_number_value(task.stage_progress[i]);
  }
  record.stage_progress_json = ToJson(progress);

  record.message       = task.message.value_or("");
  record.error_json    = task.error ? ToJson(*task.error) : "";
  record.result_json   = task.result ? ToJson(*task.result) : "";
  record.created_at_ms = util::ToUnixMillis(task.created_at);
  record.updated_at_ms = util::ToUnixMillis(task.updated_at);
  record.sequence      = task.sequence;
  return record;
}

GenerationTask FromRecord(const db::model::TaskRecord& record) {
  GenerationTask task;
  task.id       = record.id;
  task.owner_id = record.owner_id;
  task.prompt   = record.prompt;
  FromJson(record.config_json, &task.config);

  const auto status = model::ParseTaskStatus(record.status);
  const auto stage  = model::ParseTaskStatus(record.stage);
  if (!status || !stage) {
    throw std::runtime_error("task " + record.id + " has unknown status '" + record.status + "' or stage '" + record.stage + "'");
  }
  task.status = *status;
  task.stage  = *stage;

  google::protobuf::Struct progress;
  FromJson(record.stage_progress_json, &progress);
  for (std::size_t i = 0; i < model::kStageCount; ++i) {
    const auto it = progress.fields().find(std::string(model::ToString(model::kPipeline[i])));
    if (it != progress.fields().end()) {
      task.stage_progress[i] = static_cast<int>(it->second.number_value());
    }
  }

  if (!record.message.empty()) {
    task.message = record.message;
  }
  if (!record.error_json.empty()) {
    task.error.emplace();
    FromJson(record.error_json, &*task.error);
  }
  if (!record.result_json.empty()) {
    task.result.emplace();
    FromJson(record.result_json, &*task.result);
  }
  task.created_at = util::FromUnixMillis(record.created_at_ms);
  task.updated_at = util::FromUnixMillis(record.updated_at_ms);
  task.sequence   = record.sequence;
  return task;
}

db::model::SceneRecord ToRecord(const std::string& task_id, const Scene& scene) {
  db::model::SceneRecord record;
  record.task_id         = task_id;
  record.index           = scene.index;
  record.title           = scene.title;
  record.script_text     = scene.script_text;
  record.visual_prompt   = scene.visual_prompt;
  record.audio_prompt    = scene.audio_prompt;
  record.music_prompt    = scene.music_prompt;
  record.weight          = scene.weight;
  record.target_duration = scene.target_duration;
  record.actual_duration = scene.actual_duration;
  record.image_ref       = scene.Asset(AssetSlot::kImage);
  record.speech_ref      = scene.Asset(AssetSlot::kSpeech);
  record.music_ref       = scene.Asset(AssetSlot::kMusic);
  record.mixed_audio_ref = scene.Asset(AssetSlot::kMixedAudio);
  record.video_ref       = scene.Asset(AssetSlot::kVideo);
  record.final_scene_ref = scene.Asset(AssetSlot::kFinalScene);
  return record;
}

Scene FromRecord(const db::model::SceneRecord& record) {
  Scene scene;
  scene.index           = record.index;
  scene.title           = record.title;
  scene.script_text     = record.script_text;
  scene.visual_prompt   = record.visual_prompt;
  scene.audio_prompt    = record.audio_prompt;
  scene.music_prompt    = record.music_prompt;
  scene.weight          = record.weight;
  scene.target_duration = record.target_duration;
  scene.actual_duration = record.actual_duration;
  scene.assets          = {record.image_ref, record.speech_ref, record.music_ref, record.mixed_audio_ref, record.video_ref, record.final_scene_ref};
  return scene;
}

} // namespace

TaskStore::TaskStore(std::shared_ptr<db::Repository> repository, TaskLifecycle lifecycle)
    : repository_(std::move(repository)), lifecycle_(std::move(lifecycle)) {
}

std::shared_ptr<TaskStore::Entry> TaskStore::Find(const std::string& task_id) const {
  std::shared_lock lock(entries_mutex_);
  auto             it = entries_.find(task_id);
  if (it == entries_.end()) {
    throw util::NotFound("task not found: " + task_id);
  }
  return it->second;
}

void TaskStore::PersistTask(const GenerationTask& task) {
  std::scoped_lock write_lock(write_mutex_);
  auto             tx = repository_->Begin();
  ThrowIfDbError(repository_->UpdateTask(*tx, ToRecord(task)), "update task");
  tx->Commit();
}

void TaskStore::PersistScenes(const std::string& task_id, const std::vector<Scene>& scenes) {
  std::scoped_lock write_lock(write_mutex_);
  auto             tx = repository_->Begin();
  for (const auto& scene : scenes) {
    ThrowIfDbError(repository_->UpsertScene(*tx, ToRecord(task_id, scene)), "upsert scene");
  }
  tx->Commit();
}

GenerationTask TaskStore::Create(const std::string& owner_id, const std::string& prompt, const orchestrator::v1::TaskConfig& config) {
  auto  entry     = std::make_shared<Entry>();
  auto& task      = entry->task;
  task.id         = util::NewId();
  task.owner_id   = owner_id;
  task.prompt     = prompt;
  task.config     = config;
  task.created_at = util::Now();
  task.updated_at = task.created_at;
  task.sequence   = 1;

  {
    std::scoped_lock write_lock(write_mutex_);
    auto             tx = repository_->Begin();
    ThrowIfDbError(repository_->InsertTask(*tx, ToRecord(task)), "insert task");
    tx->Commit();
  }

  std::unique_lock lock(entries_mutex_);
  entries_[task.id] = entry;
  return task;
}

GenerationTask TaskStore::Get(const std::string& task_id) const {
  auto             entry = Find(task_id);
  std::scoped_lock lock(entry->mutex);
  return entry->task;
}

bool TaskStore::Mutate(const std::string& task_id, const Mutation& fn) {
  auto             entry = Find(task_id);
  std::scoped_lock lock(entry->mutex);
  if (entry->task.IsTerminal()) {
    return false;
  }

  auto next = entry->task;
  fn(next);
  next.updated_at = std::max(util::Now(), entry->task.updated_at);
  next.sequence   = entry->task.sequence + 1;

  PersistTask(next);
  entry->task = std::move(next);
  return true;
}

void TaskStore::SetScenes(const std::string& task_id, std::vector<Scene> scenes) {
  auto             entry = Find(task_id);
  std::scoped_lock lock(entry->mutex);
  if (entry->task.IsTerminal()) {
    throw util::InvalidState("task " + task_id + " is " + std::string(model::ToString(entry->task.status)));
  }
  if (!entry->scenes.empty()) {
    throw util::InvalidState("scenes already set for task " + task_id);
  }

  std::sort(scenes.begin(), scenes.end(), [](const Scene& a, const Scene& b) { return a.index < b.index; });
  for (std::size_t i = 0; i < scenes.size(); ++i) {
    if (scenes[i].index != i) {
      throw util::InvalidArgument("scene indexes must be 0..n-1 without gaps");
    }
  }

  PersistScenes(task_id, scenes);
  entry->scenes = std::move(scenes);
}

bool TaskStore::SetSceneAsset(const std::string& task_id, std::uint32_t index, AssetSlot slot, const std::string& ref,
                              std::optional<double> actual_duration) {
  auto             entry = Find(task_id);
  std::scoped_lock lock(entry->mutex);
  if (entry->task.IsTerminal()) {
    return false;
  }
  if (index >= entry->scenes.size()) {
    throw util::NotFound("scene " + std::to_string(index) + " of task " + task_id);
  }

  auto scene = entry->scenes[index];
  if (scene.HasAsset(slot)) {
    throw util::InvalidState("scene " + std::to_string(index) + " already has a " + std::string(model::ToString(slot)) + " asset");
  }
  scene.assets[static_cast<std::size_t>(slot)] = ref;
  if (actual_duration) {
    scene.actual_duration = *actual_duration;
  }

  PersistScenes(task_id, {scene});
  entry->scenes[index] = std::move(scene);
  return true;
}

std::vector<Scene> TaskStore::Scenes(const std::string& task_id) const {
  auto             entry = Find(task_id);
  std::scoped_lock lock(entry->mutex);
  return entry->scenes;
}

std::vector<GenerationTask> TaskStore::ListByOwner(const std::string& owner_id) const {
  std::vector<std::shared_ptr<Entry>> all;
  {
    std::shared_lock lock(entries_mutex_);
    for (const auto& [_, entry] : entries_) {
      all.push_back(entry);
    }
  }

  std::vector<GenerationTask> tasks;
  for (const auto& entry : all) {
    std::scoped_lock lock(entry->mutex);
    if (entry->task.owner_id == owner_id) {
      tasks.push_back(entry->task);
    }
  }
  std::sort(tasks.begin(), tasks.end(), [](const GenerationTask& a, const GenerationTask& b) {
    if (a.created_at != b.created_at) return a.created_at < b.created_at;
    return a.id < b.id;
  });
  return tasks;
}

std::size_t TaskStore::Hydrate() {
  std::vector<db::model::TaskRecord>                      records;
  std::unordered_map<std::string, std::shared_ptr<Entry>> loaded;
  {
    std::scoped_lock write_lock(write_mutex_);
    auto             tx = repository_->Begin();
    records             = repository_->ListTasks(*tx);
    for (const auto& record : records) {
      auto entry  = std::make_shared<Entry>();
      entry->task = FromRecord(record);
      for (const auto& scene : repository_->ListScenes(*tx, record.id)) {
        entry->scenes.push_back(FromRecord(scene));
      }
      loaded[record.id] = std::move(entry);
    }
    tx->Commit();
  }

  std::size_t interrupted = 0;
  for (auto& [id, entry] : loaded) {
    auto& task = entry->task;
    if (task.IsTerminal()) {
      continue;
    }
    lifecycle_.Fail(task, "internal", std::string(model::ToString(task.stage)) + ": interrupted by restart");
    task.updated_at = util::Now();
    task.sequence++;
    PersistTask(task);
    ++interrupted;
  }

  {
    std::unique_lock lock(entries_mutex_);
    entries_ = std::move(loaded);
  }

  REEL_LOG_INFO("task store hydrated", {observability::IntField("tasks", static_cast<std::int64_t>(records.size())),
                                        observability::IntField("interrupted", static_cast<std::int64_t>(interrupted))});
  return records.size();
}

std::vector<std::string> TaskStore::PurgeTerminalOlderThan(std::chrono::milliseconds max_age) {
  const auto cutoff = util::Now() - max_age;

  std::vector<std::string> expired;
  {
    std::shared_lock lock(entries_mutex_);
    for (const auto& [id, entry] : entries_) {
      std::scoped_lock entry_lock(entry->mutex);
      if (entry->task.IsTerminal() && entry->task.updated_at < cutoff) {
        expired.push_back(id);
      }
    }
  }

  for (const auto& id : expired) {
    {
      std::scoped_lock write_lock(write_mutex_);
      auto             tx = repository_->Begin();
      ThrowIfDbError(repository_->DeleteTask(*tx, id), "delete task");
      tx->Commit();
    }

    std::unique_lock lock(entries_mutex_);
    entries_.erase(id);
  }
  return expired;
}

orchestrator::v1::ProgressEvent TaskStore::GetStatus(const std::string& task_id) {
  const auto task = Get(task_id);
  return progress::BuildProgressEvent(task, lifecycle_.OverallProgress(task));
}

std::string TaskStore::OwnerOf(const std::string& task_id) {
  auto             entry = Find(task_id);
  std::scoped_lock lock(entry->mutex);
  return entry->task.owner_id;
}

std::vector<orchestrator::v1::ProgressEvent> TaskStore::ListOwnerStatuses(const std::string& owner_id) {
  std::vector<orchestrator::v1::ProgressEvent> events;
  for (const auto& task : ListByOwner(owner_id)) {
    events.push_back(progress::BuildProgressEvent(task, lifecycle_.OverallProgress(task)));
  }
  return events;
}

} // namespace reel::core
