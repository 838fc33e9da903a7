#include "sqlite_db.hpp"

#include <algorithm>
#include <array>
#include <filesystem>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace reel::db::sqlite {

namespace {

constexpr std::array<const char*, 4> kSynchronousModes = {"OFF", "NORMAL", "FULL", "EXTRA"};

void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

bool IsFileDatabase(const std::string& path) {
  return !path.empty() && path != ":memory:" && path.rfind("file:", 0) != 0;
}

// Statement handle finalized on scope exit.
struct Statement {
  sqlite3_stmt* stmt = nullptr;
  ~Statement() {
    sqlite3_finalize(stmt);
  }
};

} // namespace

SqliteDB::SqliteDB(std::string path) : SqliteDB(SqliteOptions{std::move(path)}) {
}

SqliteDB::SqliteDB(SqliteOptions options) : options_(std::move(options)) {
  if (std::none_of(kSynchronousModes.begin(), kSynchronousModes.end(), [&](const char* mode) { return options_.synchronous == mode; })) {
    throw util::InvalidArgument("unknown sqlite synchronous mode " + options_.synchronous);
  }

  if (IsFileDatabase(options_.path)) {
    const auto parent = std::filesystem::path(options_.path).parent_path();
    std::error_code ec;
    if (!parent.empty() && !std::filesystem::create_directories(parent, ec) && ec) {
      throw std::runtime_error("cannot create " + parent.string() + ": " + ec.message());
    }
  }

  int rc = sqlite3_open_v2(options_.path.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX | SQLITE_OPEN_URI,
                           nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(options_.path + ": " + msg);
  }

  try {
    Configure();
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  return stmt;
}

std::string SqliteDB::QueryText(const std::string& sql) {
  Statement s{Prepare(sql)};
  if (sqlite3_step(s.stmt) != SQLITE_ROW) {
    return {};
  }
  const auto* text = sqlite3_column_text(s.stmt, 0);
  return text ? reinterpret_cast<const char*>(text) : "";
}

std::int64_t SqliteDB::QueryInt(const std::string& sql) {
  Statement s{Prepare(sql)};
  if (sqlite3_step(s.stmt) != SQLITE_ROW) {
    return 0;
  }
  return sqlite3_column_int64(s.stmt, 0);
}

void SqliteDB::Configure() {
  ThrowIf(sqlite3_busy_timeout(db_, static_cast<int>(options_.busy_timeout.count())), db_, "busy_timeout");

  const auto application_id = QueryInt("PRAGMA application_id;");
  if (application_id != 0 && application_id != kApplicationId) {
    throw util::InvalidState(options_.path + " is not a reel task database (application_id " + std::to_string(application_id) + ")");
  }
  if (application_id == 0) {
    Exec("PRAGMA application_id=" + std::to_string(kApplicationId) + ";");
  }

  // Scene rows cascade with their task.
  Exec("PRAGMA foreign_keys=ON;");
  Exec("PRAGMA synchronous=" + options_.synchronous + ";");
  Exec("PRAGMA temp_store=MEMORY;");

  // In-memory databases keep journal_mode=memory.
  const auto journal_mode = QueryText("PRAGMA journal_mode=WAL;");
  REEL_LOG_INFO("task database opened", {observability::StringField("path", options_.path),
                                         observability::StringField("journal_mode", journal_mode),
                                         observability::StringField("synchronous", options_.synchronous)});
}

} // namespace reel::db::sqlite
