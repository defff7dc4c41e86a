#pragma once

#include <string>
#include <vector>

namespace registry::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

/*
  Ordered schema steps. Step N is recorded as schema version N+1.
  Every statement must be idempotent ("IF NOT EXISTS").
*/
const std::vector<std::string>& RegistrationSchema();

/*
  Runs migrations in order and records each version in
  schema_migrations.
*/
void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

} // namespace registry::db::sql
