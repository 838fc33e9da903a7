#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/core/task_lifecycle.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/generation_task.hpp"
#include "internal/model/scene.hpp"
#include "internal/progress/status_source.hpp"

namespace reel::core {

/*
  TaskStore

  Authoritative in-memory copy of every known task plus its scenes, written
  through to the repository on each change.

  Consistency model:
  - A mutation is applied to a copy, persisted, and only then swapped in.
    If persisting fails the in-memory task is unchanged and the error is
    rethrown.
  - Terminal tasks are frozen: Mutate and SetSceneAsset return false.
  - Each scene is updated under its task's entry lock, so concurrent
    per-scene writers never observe a half written scene list.
  - Repository writes are serialized across tasks (write_mutex_); the
    memory backend rejects overlapping transactions.
*/
class TaskStore final : public progress::StatusSource {
 public:
  using Mutation = std::function<void(model::GenerationTask&)>;

  TaskStore(std::shared_ptr<db::Repository> repository, TaskLifecycle lifecycle);

  model::GenerationTask Create(const std::string& owner_id, const std::string& prompt, const orchestrator::v1::TaskConfig& config);

  // Throws util::NotFound.
  model::GenerationTask Get(const std::string& task_id) const;

  // Applies fn to a non-terminal task, bumps updated_at and sequence and
  // persists. Returns false (fn not called) if the task is terminal.
  // Throws util::NotFound for unknown ids; exceptions from fn propagate
  // and leave the task untouched.
  bool Mutate(const std::string& task_id, const Mutation& fn);

  // Stores the scene list produced by scene breakdown. Only once per task.
  void SetScenes(const std::string& task_id, std::vector<model::Scene> scenes);

  // Write-once per slot; throws util::InvalidState if the slot is set.
  // Returns false if the task is already terminal.
  bool SetSceneAsset(const std::string& task_id, std::uint32_t index, model::AssetSlot slot, const std::string& ref,
                     std::optional<double> actual_duration = std::nullopt);

  std::vector<model::Scene> Scenes(const std::string& task_id) const;

  std::vector<model::GenerationTask> ListByOwner(const std::string& owner_id) const;

  // Loads persisted tasks. Tasks that were still running when the process
  // stopped are marked failed. Returns the number of tasks loaded.
  std::size_t Hydrate();

  // Removes terminal tasks not updated within max_age. Returns ids removed.
  std::vector<std::string> PurgeTerminalOlderThan(std::chrono::milliseconds max_age);

  orchestrator::v1::ProgressEvent              GetStatus(const std::string& task_id) override;
  std::string                                  OwnerOf(const std::string& task_id) override;
  std::vector<orchestrator::v1::ProgressEvent> ListOwnerStatuses(const std::string& owner_id) override;

  const TaskLifecycle& Lifecycle() const {
    return lifecycle_;
  }

 private:
  struct Entry {
    mutable std::mutex        mutex;
    model::GenerationTask     task;
    std::vector<model::Scene> scenes;
  };

  std::shared_ptr<Entry> Find(const std::string& task_id) const;

  void PersistTask(const model::GenerationTask& task);
  void PersistScenes(const std::string& task_id, const std::vector<model::Scene>& scenes);

  std::shared_ptr<db::Repository> repository_;
  TaskLifecycle                   lifecycle_;

  // Lock order: Entry::mutex, then write_mutex_.
  std::mutex write_mutex_;

  mutable std::shared_mutex                               entries_mutex_;
  std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
};

} // namespace reel::core
