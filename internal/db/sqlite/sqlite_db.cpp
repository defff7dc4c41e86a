#include "sqlite_db.hpp"

#include <stdexcept>

namespace registry::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, SqliteOptions options) : path_(std::move(path)), options_(std::move(options)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("sqlite open " + path_ + ": " + msg);
  }

  // report SQLITE_CONSTRAINT_UNIQUE instead of plain SQLITE_CONSTRAINT
  sqlite3_extended_result_codes(db_, 1);

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
  if (!db_) {
    throw std::runtime_error("sqlite exec: database is closed");
  }

  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  if (!db_) {
    throw std::runtime_error("sqlite prepare: database is closed");
  }

  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  return stmt;
}

void SqliteDB::Configure() {
  if (options_.synchronous != "NORMAL" && options_.synchronous != "FULL") {
    throw std::runtime_error("sqlite synchronous must be NORMAL or FULL, got '" + options_.synchronous + "'");
  }

  // IMPORTANT: WAL enables concurrent readers while writer holds lock
  Exec("PRAGMA journal_mode=WAL;");

  // NORMAL may lose the last commits on power loss; Close() checkpoints
  Exec("PRAGMA synchronous=" + options_.synchronous + ";");

  // wait for locks held by other processes instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, options_.busy_timeout_ms), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
  Exec("PRAGMA cache_size=1000;");
}

void SqliteDB::Close() {
  auto lock = LockTransaction();
  if (!db_) return;

  // copy all WAL frames back into the database file and fsync it
  int rc = sqlite3_wal_checkpoint_v2(db_, nullptr, SQLITE_CHECKPOINT_TRUNCATE, nullptr, nullptr);
  std::string checkpoint_error = rc == SQLITE_OK ? std::string() : std::string(sqlite3_errmsg(db_));

  rc = sqlite3_close(db_);
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite close: ") + sqlite3_errmsg(db_));
  }
  db_ = nullptr;

  if (!checkpoint_error.empty()) {
    throw std::runtime_error("sqlite checkpoint: " + checkpoint_error);
  }
}

} // namespace registry::db::sqlite
