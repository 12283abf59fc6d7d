#include "migrations.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "sql_queries.hpp"

namespace expiringdict::db::sql {

using observability::IntField;
using observability::StringField;

SchemaManager::SchemaManager(sqlite::SqliteDB& db, const sqlite::Capabilities& caps) : db_(db), caps_(caps) {
}

bool SchemaManager::TableExists(const Identifier& table) {
  auto st = db_.Prepare("SELECT 1 FROM sqlite_master WHERE type='table' AND name=?;");
  st.BindText(1, table.Value());
  return st.Step();
}

void SchemaManager::CheckApplicationId() {
  const int64_t application_id = db_.QueryInt64("PRAGMA application_id;");
  if (application_id == kApplicationId) return;

  if (application_id != 0) {
    throw util::IncompatibleFile("illegal application ID " + std::to_string(application_id) + " in " + db_.Path());
  }
  if (db_.ReadOnly()) {
    throw util::ReadOnlyViolation("cannot stamp application ID on read-only database " + db_.Path());
  }
  db_.Exec("PRAGMA application_id = " + std::to_string(kApplicationId) + ";");
}

void SchemaManager::Ensure(const Identifier& table) {
  CheckApplicationId();

  const int64_t user_version = db_.QueryInt64("PRAGMA user_version;");

  if (user_version > kSchemaVersion) {
    throw util::UnsupportedSchema("schema version " + std::to_string(user_version) + " of " + db_.Path() +
                                  " is newer than supported version " + std::to_string(kSchemaVersion));
  }

  if (user_version == kSchemaVersion) {
    // the version is per file; further tables are created on first use
    if (!TableExists(table)) {
      if (db_.ReadOnly()) {
        throw util::ReadOnlyViolation("table " + table.Value() + " does not exist in read-only database");
      }
      CreateTable(table, /*if_not_exists=*/true);
    }
    return;
  }

  if (db_.ReadOnly()) {
    throw util::ReadOnlyViolation("schema migration required for read-only database " + db_.Path());
  }

  // A fresh file and a pre-versioning file both report version 0; only
  // the catalog tells them apart.
  if (TableExists(table)) {
    MigrateFromV0(table);
  } else {
    CreateTable(table, /*if_not_exists=*/false);
  }

  db_.Exec("PRAGMA user_version = " + std::to_string(kSchemaVersion) + ";");
}

void SchemaManager::CreateTable(const Identifier& table, bool if_not_exists) {
  const std::string t         = table.Quoted();
  const std::string value     = caps_.strict_tables ? "ANY" : "BLOB";
  const std::string trailer   = caps_.strict_tables ? " STRICT" : "";
  const std::string if_absent = if_not_exists ? "IF NOT EXISTS " : "";
  const std::string now       = TableQueries(table, caps_).now;

  // AUTOINCREMENT keeps ids monotonic so new keys always iterate last
  db_.Exec("CREATE TABLE " + if_absent + t +
           " ("
           "id INTEGER PRIMARY KEY AUTOINCREMENT NOT NULL, "
           "key TEXT UNIQUE NOT NULL, "
           "expire INTEGER NOT NULL, "
           "value " +
           value + " NOT NULL)" + trailer + ";");

  db_.Exec("CREATE INDEX " + if_absent + (table + "_expire_index").Quoted() + " ON " + t + " (expire);");

  db_.Exec("CREATE TRIGGER " + if_absent + (table + "_insert_trigger").Quoted() + " AFTER INSERT ON " + t +
           " BEGIN DELETE FROM " + t + " WHERE expire <= " + now + "; END;");

  // OF value: postponement only touches expire and must not evict
  db_.Exec("CREATE TRIGGER " + if_absent + (table + "_update_trigger").Quoted() + " AFTER UPDATE OF value ON " + t +
           " BEGIN DELETE FROM " + t + " WHERE expire <= " + now + "; END;");

  EXPIRINGDICT_LOG_DEBUG("created table", {StringField("table", table.Value()), StringField("path", db_.Path())});
}

void SchemaManager::MigrateFromV0(const Identifier& table) {
  const auto old_table = table + "_v0";

  db_.Exec("DROP INDEX IF EXISTS " + (table + "_expire_index").Quoted() + ";");
  db_.Exec("DROP TRIGGER IF EXISTS " + (table + "_insert_trigger").Quoted() + ";");
  db_.Exec("DROP TRIGGER IF EXISTS " + (table + "_update_trigger").Quoted() + ";");
  db_.Exec("ALTER TABLE " + table.Quoted() + " RENAME TO " + old_table.Quoted() + ";");

  CreateTable(table, /*if_not_exists=*/false);

  // no ORDER BY: legacy tables may be WITHOUT ROWID
  db_.Exec("INSERT INTO " + table.Quoted() + " (key, expire, value) SELECT key, expire, value FROM " +
           old_table.Quoted() + ";");
  const int copied = db_.Changes();

  db_.Exec("DROP TABLE " + old_table.Quoted() + ";");

  EXPIRINGDICT_LOG_DEBUG("migrated legacy table",
                        {StringField("table", table.Value()), IntField("rows", copied),
                         IntField("from_version", 0), IntField("to_version", kSchemaVersion)});
}

} // namespace expiringdict::db::sql
