#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace reel::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertTask(Transaction&, const model::TaskRecord&) override;
  std::optional<model::TaskRecord> GetTask(Transaction&, const std::string&) override;
  std::vector<model::TaskRecord> ListTasks(Transaction&) override;
  std::vector<model::TaskRecord> ListTasksByOwner(Transaction&, const std::string&) override;
  Result UpdateTask(Transaction&, const model::TaskRecord&) override;
  Result DeleteTask(Transaction&, const std::string&) override;

  Result UpsertScene(Transaction&, const model::SceneRecord&) override;
  std::vector<model::SceneRecord> ListScenes(Transaction&, const std::string&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::TaskRecord> tasks;
    // task_id -> index -> scene; std::map keeps scenes ordered.
    std::unordered_map<std::string, std::map<uint32_t, model::SceneRecord>> scenes;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace reel::db::memory
