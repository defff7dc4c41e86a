#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/migrations.hpp"
#include "internal/db/sql/sql_queries.hpp"

namespace registry::db::sqlite {

using registry::db::ErrorCode;
using registry::db::Result;

namespace {

class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(SqliteDB& db) : db_(db) {}

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

 private:
  SqliteDB& db_;
};

// Finalizes the statement on every exit path.
struct StatementGuard {
  sqlite3_stmt* st = nullptr;
  ~StatementGuard() {
    if (st) sqlite3_finalize(st);
  }
};

} // namespace

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? std::string(reinterpret_cast<const char*>(t), static_cast<std::size_t>(sqlite3_column_bytes(st, col))) : "";
}

static int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

void SqliteRepository::EnsureSchema() {
    auto lock = db_->LockTransaction();
    SqliteMigrationExecutor executor(*db_);
    sql::RunMigrations(executor, sql::RegistrationSchema());
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    // extended codes: SQLITE_CONSTRAINT_UNIQUE, SQLITE_IOERR_WRITE, ...
    if (rc == SQLITE_CONSTRAINT_UNIQUE || rc == SQLITE_CONSTRAINT_PRIMARYKEY)
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
        case SQLITE_CANTOPEN:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Registrations
// ------------------------------------------------------------------

Result SqliteRepository::InsertRegistration(Transaction& t, model::RegistrationRecord& r) {
    auto* db = TX(t).Handle();
    if (!db) return Result::Err(ErrorCode::Closed, "database is closed");

    StatementGuard guard;
    int rc = sqlite3_prepare_v2(db, sql::INSERT_REGISTRATION, -1, &guard.st, nullptr);
    if (rc != SQLITE_OK) return Translate(db, rc);

    BindText(guard.st, 1, r.eth_address);
    BindText(guard.st, 2, r.rgb_address);
    BindText(guard.st, 3, r.signature);
    BindText(guard.st, 4, r.message);

    rc = sqlite3_step(guard.st);
    if (rc != SQLITE_ROW) {
        return Translate(db, rc);
    }

    r.id         = ColI64(guard.st, 0);
    r.created_at = ColText(guard.st, 1);
    r.updated_at = ColText(guard.st, 2);

    // drain so the RETURNING statement completes
    rc = sqlite3_step(guard.st);
    return Translate(db, rc);
}

std::vector<model::RegistrationRecord> SqliteRepository::ListRegistrations(Transaction& t) {
    auto* db = TX(t).Handle();
    if (!db) throw std::runtime_error("list registrations: database is closed");

    StatementGuard guard;
    if (sqlite3_prepare_v2(db, sql::SELECT_REGISTRATIONS, -1, &guard.st, nullptr) != SQLITE_OK)
        throw std::runtime_error(std::string("list registrations: ") + sqlite3_errmsg(db));

    std::vector<model::RegistrationRecord> out;
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(guard.st)) == SQLITE_ROW) {
        model::RegistrationRecord r;
        r.id          = ColI64(guard.st, 0);
        r.eth_address = ColText(guard.st, 1);
        r.rgb_address = ColText(guard.st, 2);
        r.signature   = ColText(guard.st, 3);
        r.message     = ColText(guard.st, 4);
        r.created_at  = ColText(guard.st, 5);
        r.updated_at  = ColText(guard.st, 6);
        out.push_back(std::move(r));
    }

    if (rc != SQLITE_DONE)
        throw std::runtime_error(std::string("list registrations: ") + sqlite3_errmsg(db));

    return out;
}

void SqliteRepository::Close() {
    db_->Close();
}

} // namespace registry::db::sqlite
