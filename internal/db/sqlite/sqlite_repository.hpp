#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace reel::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

}
