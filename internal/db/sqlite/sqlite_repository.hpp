#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace registry::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  void EnsureSchema() override;

  std::unique_ptr<Transaction> Begin() override;

  Result InsertRegistration(Transaction&, model::RegistrationRecord&) override;
  std::vector<model::RegistrationRecord> ListRegistrations(Transaction&) override;

  void Close() override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
