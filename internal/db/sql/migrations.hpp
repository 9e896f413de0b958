#pragma once

#include <string>
#include <vector>

namespace warden::db::sql {

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
  Runs migrations in order and records each version in
  warden_schema_migrations. Every migration must be idempotent
  (IF NOT EXISTS) because the whole list is replayed on each start.
*/

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

} // namespace warden::db::sql
