#pragma once

#include <memory>

#include "sqlite_db.hpp"

namespace swarm::db::sqlite {

// Current schema version recorded in schema_migrations.
inline constexpr int kSchemaVersion = 1;

/*
  Creates all tables and indexes if missing, then probes every table
  so that a file with an incompatible layout fails at startup rather
  than on the first write.
*/
void BootstrapSchema(const std::shared_ptr<SqliteDB>& db);

} // namespace swarm::db::sqlite
