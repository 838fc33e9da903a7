#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/scene_record.hpp"
#include "internal/db/model/task_record.hpp"

namespace reel::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Deleting a task deletes its scenes

  The DB is the durable copy of:
    task lifecycle state
    scene descriptors and asset references
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Tasks
  // ---------------------------------------------------------------------

  virtual Result InsertTask(Transaction&, const model::TaskRecord&) = 0;

  virtual std::optional<model::TaskRecord> GetTask(Transaction&, const std::string& id) = 0;

  // Ordered by created_at_ms, then id.
  virtual std::vector<model::TaskRecord> ListTasks(Transaction&) = 0;

  virtual std::vector<model::TaskRecord> ListTasksByOwner(Transaction&, const std::string& owner_id) = 0;

  virtual Result UpdateTask(Transaction&, const model::TaskRecord&) = 0;

  virtual Result DeleteTask(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Scenes
  // ---------------------------------------------------------------------

  // Fails with NotFound if the owning task does not exist.
  virtual Result UpsertScene(Transaction&, const model::SceneRecord&) = 0;

  // Ordered by index.
  virtual std::vector<model::SceneRecord> ListScenes(Transaction&, const std::string& task_id) = 0;
};

} // namespace reel::db
