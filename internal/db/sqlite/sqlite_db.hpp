#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <string>

namespace relaystore::db::sqlite {

struct StatementDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

/*
  Thin RAII wrapper around one sqlite3* connection.
*/
class SqliteDB {
 public:
  static constexpr uint32_t kDefaultBusyTimeoutMs = 5000;

  explicit SqliteDB(std::string path, uint32_t busy_timeout_ms = kDefaultBusyTimeoutMs);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  uint32_t BusyTimeoutMs() const {
    return busy_timeout_ms_;
  }

  // Execute a SQL string (used for pragmas/bootstrap). Throws on failure.
  void Exec(const std::string& sql);

  // Prepare a statement. Throws on failure.
  Statement Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  uint32_t    busy_timeout_ms_;
};

} // namespace relaystore::db::sqlite
