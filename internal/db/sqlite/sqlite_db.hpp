#pragma once

#include <sqlite3.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace reel::db::sqlite {

// Stored in the header's application_id field ("REEL").
inline constexpr std::int32_t kApplicationId = 0x5245454C;

struct SqliteOptions {
  std::string               path;
  std::chrono::milliseconds busy_timeout{5000};
  // OFF | NORMAL | FULL | EXTRA
  std::string synchronous = "NORMAL";
};

/*
  RAII wrapper around the task database connection.

  Opening creates missing parent directories, switches file databases to
  WAL and stamps the file with kApplicationId. A file stamped by another
  application is refused with util::InvalidState.
*/
class SqliteDB {
 public:
  explicit SqliteDB(SqliteOptions options);
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // First column of the first row, as text / integer.
  std::string  QueryText(const std::string& sql);
  std::int64_t QueryInt(const std::string& sql);

  // Held by a SqliteTransaction for its lifetime.
  std::mutex& TxMutex() {
    return tx_mutex_;
  }

 private:
  void Configure();

  sqlite3*      db_ = nullptr;
  SqliteOptions options_;
  std::mutex    tx_mutex_;
};

} // namespace reel::db::sqlite
