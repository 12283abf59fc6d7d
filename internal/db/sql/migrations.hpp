#pragma once

#include <cstdint>

#include "identifier.hpp"
#include "internal/db/sqlite/capabilities.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"

namespace expiringdict::db::sql {

// PRAGMA application_id stamped into every file this library owns
inline constexpr int64_t kApplicationId = 1820903862;

// PRAGMA user_version of the current layout
inline constexpr int64_t kSchemaVersion = 1;

/*
  Owns table creation and forward migration.

  Must run inside the caller's transaction, so a failure part way leaves
  the file untouched.

  Versions:
    0  legacy unversioned layout: key/expire/value, no id column
    1  id INTEGER PRIMARY KEY AUTOINCREMENT, key UNIQUE, STRICT when
       available, expire index, insert + update-of-value eviction triggers
*/
class SchemaManager {
 public:
  SchemaManager(sqlite::SqliteDB& db, const sqlite::Capabilities& caps);

  // Validates the file stamps and brings `table` to kSchemaVersion.
  // Throws IncompatibleFile, UnsupportedSchema, or ReadOnlyViolation when
  // a read-only handle would need to write.
  void Ensure(const Identifier& table);

  bool TableExists(const Identifier& table);

 private:
  void CheckApplicationId();
  void CreateTable(const Identifier& table, bool if_not_exists);
  void MigrateFromV0(const Identifier& table);

  sqlite::SqliteDB&           db_;
  const sqlite::Capabilities& caps_;
};

} // namespace expiringdict::db::sql
