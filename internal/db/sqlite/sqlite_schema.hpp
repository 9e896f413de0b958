#pragma once

#include <string>
#include <vector>

#include "sqlite_db.hpp"

namespace warden::db::sqlite {

// Ordered, idempotent schema for the events and updates tables.
const std::vector<std::string>& SchemaMigrations();

void BootstrapSchema(SqliteDB& db);

} // namespace warden::db::sqlite
