#pragma once

#include <string>

#include "identifier.hpp"
#include "internal/db/sqlite/capabilities.hpp"

namespace expiringdict::db::sql {

enum class Order {
  kId,     // insertion order
  kKey,    // lexical key order
  kExpire, // expiry order
};

const char* ColumnFor(Order order);

/*
  Canonical SQL for one table.

  Built once per Connection from the quoted table name and the engine
  capability table. "?" placeholders are always values, never names.
*/
struct TableQueries {
  TableQueries(const Identifier& table, const sqlite::Capabilities& caps);

  // current time in epoch seconds, as an SQL expression
  std::string now;

  std::string count;
  std::string contains;
  std::string select_value;

  std::string upsert; // empty without atomic upsert support
  std::string insert;
  std::string update;

  std::string erase;
  std::string clear;

  std::string postpone;
  std::string postpone_all;

  std::string table; // quoted

  // SELECT <columns> FROM <table> ORDER BY <order> ASC|DESC
  std::string Select(const char* columns, Order order, bool reverse) const;
};

} // namespace expiringdict::db::sql
