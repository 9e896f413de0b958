#include "sqlite_schema.hpp"

#include "internal/db/sql/migrations.hpp"

namespace warden::db::sqlite {

const std::vector<std::string>& SchemaMigrations() {
  static const std::vector<std::string> kMigrations = {
      // 1: event log
      "CREATE TABLE IF NOT EXISTS events ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " kind TEXT NOT NULL,"
      " payload TEXT,"
      " update_id INTEGER,"
      " created_at INTEGER NOT NULL DEFAULT (CAST(strftime('%s','now') AS INTEGER) * 1000));",

      // 2: update records
      "CREATE TABLE IF NOT EXISTS updates ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " name TEXT NOT NULL,"
      " version TEXT,"
      " state TEXT NOT NULL DEFAULT 'pending' CHECK (state IN ('pending','applied','failed','rolled_back')),"
      " meta TEXT,"
      " created_at INTEGER NOT NULL DEFAULT (CAST(strftime('%s','now') AS INTEGER) * 1000));",

      // 3: lookup by referenced update
      "CREATE INDEX IF NOT EXISTS events_by_update ON events(update_id, id);",

      // 4: pending uniqueness per (name, version); NULL and '' are one identity
      "CREATE UNIQUE INDEX IF NOT EXISTS updates_one_pending ON updates(name, COALESCE(version, '')) WHERE state = 'pending';",

      "CREATE INDEX IF NOT EXISTS updates_by_state ON updates(state);",

      // 6-7: the log is append-only
      "CREATE TRIGGER IF NOT EXISTS events_no_update BEFORE UPDATE ON events"
      " BEGIN SELECT RAISE(ABORT, 'events are append-only'); END;",
      "CREATE TRIGGER IF NOT EXISTS events_no_delete BEFORE DELETE ON events"
      " BEGIN SELECT RAISE(ABORT, 'events are append-only'); END;",
  };
  return kMigrations;
}

void BootstrapSchema(SqliteDB& db) {
  std::lock_guard<std::mutex> lock(db.TxMutex());
  sql::RunMigrations(db, SchemaMigrations());

  db.Exec("SELECT id,kind,payload,update_id,created_at FROM events LIMIT 1;");
  db.Exec("SELECT id,name,version,state,meta,created_at FROM updates LIMIT 1;");
}

} // namespace warden::db::sqlite
