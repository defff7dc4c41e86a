#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace registry::db::sqlite {

struct SqliteOptions {
  // NORMAL or FULL
  std::string synchronous     = "NORMAL";
  int         busy_timeout_ms = 5000;
};

/*
  Thin RAII wrapper around sqlite3*.

  The connection is opened in serialized mode and shared by every
  request thread. Transactions take the connection lock for their whole
  lifetime so that statements of two transactions never interleave.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  bool IsOpen() const {
    return db_ != nullptr;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Held by a transaction from BEGIN until COMMIT/ROLLBACK.
  std::unique_lock<std::mutex> LockTransaction() {
    return std::unique_lock<std::mutex>(tx_mutex_);
  }

  // Checkpoints the WAL into the main file and closes the handle. Idempotent.
  void Close();

 private:
  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

  sqlite3*      db_ = nullptr;
  std::string   path_;
  SqliteOptions options_;
  std::mutex    tx_mutex_;
};

} // namespace registry::db::sqlite
