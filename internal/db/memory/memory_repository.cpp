#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace reel::db::memory {

namespace {

void SortByCreation(std::vector<model::TaskRecord>& records) {
  std::sort(records.begin(), records.end(), [](const model::TaskRecord& a, const model::TaskRecord& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
    return a.id < b.id;
  });
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertTask(Transaction& t, const model::TaskRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.tasks.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "task exists: " + r.id);
  s.tasks[r.id] = r;
  return Result::Ok();
}

std::optional<model::TaskRecord> MemoryRepository::GetTask(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.tasks.find(id);
  if (it == s.tasks.end()) return std::nullopt;
  return it->second;
}

std::vector<model::TaskRecord> MemoryRepository::ListTasks(Transaction& t) {
  const auto&                    s = TX(t).View();
  std::vector<model::TaskRecord> records;
  records.reserve(s.tasks.size());
  for (const auto& [_, record] : s.tasks) {
    records.push_back(record);
  }
  SortByCreation(records);
  return records;
}

std::vector<model::TaskRecord> MemoryRepository::ListTasksByOwner(Transaction& t, const std::string& owner_id) {
  std::vector<model::TaskRecord> records;
  for (const auto& [_, record] : TX(t).View().tasks) {
    if (record.owner_id == owner_id) records.push_back(record);
  }
  SortByCreation(records);
  return records;
}

Result MemoryRepository::UpdateTask(Transaction& t, const model::TaskRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.tasks.contains(r.id)) return Result::Err(ErrorCode::NotFound, "task not found: " + r.id);
  s.tasks[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteTask(Transaction& t, const std::string& id) {
  auto& s = TX(t).Mutable();
  s.tasks.erase(id);
  s.scenes.erase(id);
  return Result::Ok();
}

Result MemoryRepository::UpsertScene(Transaction& t, const model::SceneRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.tasks.contains(r.task_id)) return Result::Err(ErrorCode::NotFound, "task not found: " + r.task_id);
  s.scenes[r.task_id][r.index] = r;
  return Result::Ok();
}

std::vector<model::SceneRecord> MemoryRepository::ListScenes(Transaction& t, const std::string& task_id) {
  std::vector<model::SceneRecord> out;
  const auto&                     s  = TX(t).View();
  auto                            it = s.scenes.find(task_id);
  if (it == s.scenes.end()) return out;
  for (const auto& [_, scene] : it->second)
    out.push_back(scene);
  return out;
}

} // namespace reel::db::memory
