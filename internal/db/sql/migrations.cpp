#include "internal/db/sql/migrations.hpp"

#include "internal/db/sql/sql_queries.hpp"

namespace registry::db::sql {

const std::vector<std::string>& RegistrationSchema() {
  static const std::vector<std::string> kSchema = {
      CREATE_REGISTRATIONS,
      CREATE_INDEXES,
  };
  return kSchema;
}

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  executor.ExecuteSQL(CREATE_SCHEMA_MIGRATIONS);

  for (std::size_t i = 0; i < ordered_sql.size(); ++i) {
    executor.ExecuteSQL(ordered_sql[i]);
    executor.ExecuteSQL("INSERT OR IGNORE INTO schema_migrations(version,applied_at) VALUES(" + std::to_string(i + 1) +
                        ",strftime('%Y-%m-%dT%H:%M:%fZ','now'));");
  }
}

} // namespace registry::db::sql
