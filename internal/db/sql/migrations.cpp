#include "migrations.hpp"

#include "internal/util/time.hpp"

namespace warden::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  executor.ExecuteSQL(
      "CREATE TABLE IF NOT EXISTS warden_schema_migrations (version INTEGER PRIMARY KEY, applied_at INTEGER NOT NULL);");

  const auto now = std::to_string(warden::util::NowMillis());
  for (std::size_t i = 0; i < ordered_sql.size(); ++i) {
    executor.ExecuteSQL(ordered_sql[i]);
    executor.ExecuteSQL("INSERT INTO warden_schema_migrations(version, applied_at) VALUES(" + std::to_string(i + 1) + ", " + now +
                        ") ON CONFLICT(version) DO NOTHING;");
  }
}

} // namespace warden::db::sql
