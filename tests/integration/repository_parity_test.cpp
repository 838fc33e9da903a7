#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"

#if REEL_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace {

using reel::db::ErrorCode;
using reel::db::Repository;
using reel::db::memory::MemoryRepository;
using reel::db::model::SceneRecord;
using reel::db::model::TaskRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

TaskRecord MakeTask(const std::string& id, const std::string& owner, uint64_t created_at_ms) {
  TaskRecord task;
  task.id                  = id;
  task.owner_id            = owner;
  task.prompt              = "a lighthouse at dawn";
  task.config_json         = R"({"totalDurationS":30})";
  task.status              = "pending";
  task.stage               = "analyzing_prompt";
  task.stage_progress_json = "{}";
  task.created_at_ms       = created_at_ms;
  task.updated_at_ms       = created_at_ms;
  task.sequence            = 1;
  return task;
}

SceneRecord MakeScene(const std::string& task_id, uint32_t index) {
  SceneRecord scene;
  scene.task_id         = task_id;
  scene.index           = index;
  scene.title           = "scene " + std::to_string(index);
  scene.script_text     = "narration";
  scene.weight          = 1.5;
  scene.target_duration = 10.0;
  return scene;
}

void VerifyTaskLifecycle(Repository& repo, const std::string& id) {
  auto tx = repo.Begin();

  assert(repo.InsertTask(*tx, MakeTask(id, "alice", NowMs())));
  const auto duplicate = repo.InsertTask(*tx, MakeTask(id, "alice", NowMs()));
  assert(!duplicate);
  assert(duplicate.code == ErrorCode::AlreadyExists);

  auto loaded = repo.GetTask(*tx, id);
  assert(loaded.has_value());
  assert(loaded->owner_id == "alice");
  assert(loaded->config_json == R"({"totalDurationS":30})");

  loaded->status      = "failed";
  loaded->message     = "generating_audio: request rejected";
  loaded->error_json  = R"({"kind":"provider_permanent"})";
  loaded->sequence    = 7;
  assert(repo.UpdateTask(*tx, *loaded));

  const auto updated = repo.GetTask(*tx, id);
  assert(updated->status == "failed");
  assert(updated->error_json == R"({"kind":"provider_permanent"})");
  assert(updated->sequence == 7);

  const auto missing = repo.UpdateTask(*tx, MakeTask(id + "-missing", "alice", 0));
  assert(missing.code == ErrorCode::NotFound);

  assert(repo.DeleteTask(*tx, id));
  assert(!repo.GetTask(*tx, id).has_value());
  tx->Commit();
}

void VerifyScenes(Repository& repo, const std::string& id) {
  auto tx = repo.Begin();
  assert(repo.InsertTask(*tx, MakeTask(id, "alice", NowMs())));

  assert(repo.UpsertScene(*tx, MakeScene(id, 1)));
  assert(repo.UpsertScene(*tx, MakeScene(id, 0)));

  auto scene      = MakeScene(id, 1);
  scene.image_ref = "asset://img-1";
  assert(repo.UpsertScene(*tx, scene));

  const auto scenes = repo.ListScenes(*tx, id);
  assert(scenes.size() == 2);
  assert(scenes[0].index == 0);
  assert(scenes[1].index == 1);
  assert(scenes[1].image_ref == "asset://img-1");
  assert(scenes[1].weight == 1.5);

  const auto orphan = repo.UpsertScene(*tx, MakeScene(id + "-missing", 0));
  assert(orphan.code == ErrorCode::NotFound);

  // Deleting a task deletes its scenes.
  assert(repo.DeleteTask(*tx, id));
  assert(repo.ListScenes(*tx, id).empty());
  tx->Commit();
}

void VerifyListing(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();
  assert(repo.InsertTask(*tx, MakeTask(prefix + "-b", "bob", 2000)));
  assert(repo.InsertTask(*tx, MakeTask(prefix + "-a", "bob", 1000)));
  assert(repo.InsertTask(*tx, MakeTask(prefix + "-c", "carol", 1500)));

  const auto bobs = repo.ListTasksByOwner(*tx, "bob");
  assert(bobs.size() == 2);
  assert(bobs[0].id == prefix + "-a");
  assert(bobs[1].id == prefix + "-b");

  assert(repo.ListTasks(*tx).size() >= 3);

  for (const auto& suffix : {"-a", "-b", "-c"}) {
    assert(repo.DeleteTask(*tx, prefix + suffix));
  }
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertTask(*tx, MakeTask(id, "alice", NowMs())));
    tx->Rollback();
  }
  {
    // Dropped without commit.
    auto tx = repo.Begin();
    assert(repo.InsertTask(*tx, MakeTask(id, "alice", NowMs())));
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetTask(*check_tx, id).has_value());
  check_tx->Commit();
}

void VerifyOverlappingCommits(Repository& repo, const std::string& id, bool supports_parallel_transactions) {
  if (!supports_parallel_transactions) {
    return;
  }
  {
    auto tx = repo.Begin();
    assert(repo.InsertTask(*tx, MakeTask(id, "alice", NowMs())));
    tx->Commit();
  }

  auto tx1 = repo.Begin();
  auto tx2 = repo.Begin();

  auto r1 = repo.GetTask(*tx1, id);
  auto r2 = repo.GetTask(*tx2, id);
  assert(r1.has_value() && r2.has_value());

  r1->sequence = 2;
  r2->sequence = 3;
  assert(repo.UpdateTask(*tx1, *r1));
  assert(repo.UpdateTask(*tx2, *r2));
  tx1->Commit();

  bool threw = false;
  try {
    tx2->Commit();
  } catch (const std::exception&) {
    threw = true;
  }
  assert(threw);

  auto verify_tx = repo.Begin();
  assert(repo.GetTask(*verify_tx, id)->sequence == 2);
  verify_tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx   = repo->Begin();
    auto task = MakeTask(id, "alice", NowMs());
    task.result_json = R"({"videoRef":"asset://final","durationS":30})";
    assert(repo->InsertTask(*tx, task));

    auto scene            = MakeScene(id, 0);
    scene.final_scene_ref = "asset://scene-0";
    scene.actual_duration = 9.98;
    assert(repo->UpsertScene(*tx, scene));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto t  = repo->GetTask(*tx, id);
  assert(t.has_value());
  assert(t->result_json == R"({"videoRef":"asset://final","durationS":30})");

  const auto scenes = repo->ListScenes(*tx, id);
  assert(scenes.size() == 1);
  assert(scenes[0].final_scene_ref == "asset://scene-0");
  assert(scenes[0].actual_duration == 9.98);
  tx->Commit();

  backend.cleanup();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if REEL_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("reel_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<reel::db::sqlite::SqliteDB>(db_path);
    reel::db::sqlite::BootstrapSchema(*db);
    return std::make_shared<reel::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = [db_path]() { std::filesystem::remove(db_path); },
      .supports_parallel_transactions = false,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  VerifyTaskLifecycle(*repo, backend.name + "-task-life");
  VerifyScenes(*repo, backend.name + "-scenes");
  VerifyListing(*repo, backend.name + "-listing");
  VerifyRollbackBehavior(*repo, backend.name + "-rollback");
  VerifyOverlappingCommits(*repo, backend.name + "-overlap", backend.supports_parallel_transactions);

  VerifyRestartDurability(backend, backend.name + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if REEL_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "reel_integration_repository_parity: pass\n";
  return 0;
}
