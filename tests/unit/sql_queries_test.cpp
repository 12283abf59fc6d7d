#include "internal/db/sql/sql_queries.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/db/sqlite/capabilities.hpp"

namespace {

using expiringdict::db::sql::Identifier;
using expiringdict::db::sql::Order;
using expiringdict::db::sql::TableQueries;
using expiringdict::db::sqlite::Capabilities;

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

void TestCapabilitiesByVersion() {
  auto old_engine = Capabilities::ForVersion(3022000);
  assert(!old_engine.atomic_upsert);
  assert(!old_engine.strict_tables);
  assert(!old_engine.unixepoch);

  auto upsert_only = Capabilities::ForVersion(3024000);
  assert(upsert_only.atomic_upsert);
  assert(!upsert_only.strict_tables);

  auto strict = Capabilities::ForVersion(3037000);
  assert(strict.strict_tables);
  assert(!strict.unixepoch);

  auto modern = Capabilities::ForVersion(3045001);
  assert(modern.atomic_upsert && modern.strict_tables && modern.unixepoch);
}

void TestModernQueriesUseUpsertAndUnixepoch() {
  TableQueries q(Identifier("t\"x"), Capabilities::ForVersion(3045000));
  assert(q.table == "\"t\"\"x\"");
  assert(q.now == "UNIXEPOCH()");
  assert(Contains(q.upsert, "ON CONFLICT (key) DO UPDATE SET value=excluded.value, expire=excluded.expire"));
  assert(Contains(q.upsert, "INSERT INTO \"t\"\"x\""));
  assert(Contains(q.postpone, "SET expire=UNIXEPOCH() + ?"));
  assert(!Contains(q.postpone, "value"));
}

void TestOldEngineQueriesFallBack() {
  TableQueries q(Identifier("t"), Capabilities::ForVersion(3022000));
  assert(q.upsert.empty());
  assert(q.now == "CAST(strftime('%s', 'now') AS INTEGER)");
  assert(Contains(q.insert, "VALUES (?, CAST(strftime('%s', 'now') AS INTEGER) + ?, ?)"));
}

void TestSelectOrdering() {
  TableQueries q(Identifier("t"), Capabilities::ForVersion(3045000));
  assert(q.Select("key", Order::kId, false) == "SELECT key FROM \"t\" ORDER BY id ASC;");
  assert(q.Select("key, value", Order::kKey, true) == "SELECT key, value FROM \"t\" ORDER BY key DESC;");
  assert(q.Select("value", Order::kExpire, false) == "SELECT value FROM \"t\" ORDER BY expire ASC;");
}

} // namespace

int main() {
  TestCapabilitiesByVersion();
  TestModernQueriesUseUpsertAndUnixepoch();
  TestOldEngineQueriesFallBack();
  TestSelectOrdering();

  std::cout << "expiringdict_unit_sql_queries: pass\n";
  return 0;
}
