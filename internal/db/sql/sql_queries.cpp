#include "sql_queries.hpp"

namespace expiringdict::db::sql {

const char* ColumnFor(Order order) {
  switch (order) {
    case Order::kKey:
      return "key";
    case Order::kExpire:
      return "expire";
    case Order::kId:
    default:
      return "id";
  }
}

static std::string NowExpression(const sqlite::Capabilities& caps) {
  return caps.unixepoch ? "UNIXEPOCH()" : "CAST(strftime('%s', 'now') AS INTEGER)";
}

TableQueries::TableQueries(const Identifier& t, const sqlite::Capabilities& caps)
    : now(NowExpression(caps)), table(t.Quoted()) {
  count        = "SELECT COUNT(*) FROM " + table + ";";
  contains     = "SELECT 1 FROM " + table + " WHERE key = ?;";
  select_value = "SELECT value FROM " + table + " WHERE key = ?;";

  if (caps.atomic_upsert) {
    upsert = "INSERT INTO " + table + " (key, expire, value) VALUES (?, " + now +
             " + ?, ?)"
             " ON CONFLICT (key) DO UPDATE SET value=excluded.value, expire=excluded.expire;";
  }
  insert = "INSERT INTO " + table + " (key, expire, value) VALUES (?, " + now + " + ?, ?);";
  update = "UPDATE " + table + " SET expire=" + now + " + ?, value=? WHERE key=?;";

  erase = "DELETE FROM " + table + " WHERE key=?;";
  clear = "DELETE FROM " + table + ";";

  postpone     = "UPDATE " + table + " SET expire=" + now + " + ? WHERE key=?;";
  postpone_all = "UPDATE " + table + " SET expire=" + now + " + ?;";
}

std::string TableQueries::Select(const char* columns, Order order, bool reverse) const {
  return std::string("SELECT ") + columns + " FROM " + table + " ORDER BY " + ColumnFor(order) +
         (reverse ? " DESC;" : " ASC;");
}

} // namespace expiringdict::db::sql
