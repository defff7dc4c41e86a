#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace registry::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->LockTransaction()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!committed_ && db_->IsOpen()) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      REGISTRY_LOG_WARN("sqlite rollback failed", {registry::observability::StringField("error", e.what())});
    }
  }
}

// The connection lock is released once the transaction has ended.
void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  lock_.unlock();
}

void SqliteTransaction::Rollback() {
  if (committed_) {
    return;
  }
  db_->Exec("ROLLBACK;");
  committed_ = true;
  lock_.unlock();
}

} // namespace registry::db::sqlite
