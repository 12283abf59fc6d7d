#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "internal/db/sql/identifier.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/db/sqlite/capabilities.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/util/time.hpp"

namespace expiringdict::core {

using Order = db::sql::Order;

/*
  Byte-level mapping operations on one table.

  Construction runs the schema manager, so it must happen inside a
  transaction. Values are opaque bytes here; Connection layers the
  serializer on top.

  Eviction is entirely the triggers' job: Put() fires them, Remove(),
  Clear() and the postpone calls never do.
*/
class Table {
 public:
  Table(std::shared_ptr<db::sqlite::SqliteDB> db, db::sql::Identifier name,
        const db::sqlite::Capabilities& caps = db::sqlite::Capabilities::Detect());

  const db::sql::Identifier& Name() const {
    return name_;
  }

  db::sqlite::SqliteDB& Db() const {
    return *db_;
  }

  int64_t Count() const;
  bool    Contains(const std::string& key) const;

  std::optional<std::string> Find(const std::string& key) const;

  // insert or replace; expire = now + lifespan. Replacing keeps the id.
  void Put(const std::string& key, std::string_view bytes, util::Lifespan lifespan);

  // false when the key was absent
  bool Remove(const std::string& key);

  void Clear();

  // no-op when the key is absent
  void Postpone(const std::string& key, util::Lifespan lifespan);
  void PostponeAll(util::Lifespan lifespan);

  // fresh statement over `columns`, ordered by `order`
  db::sqlite::Statement Scan(const char* columns, Order order, bool reverse) const;

 private:
  void CheckWritable(const char* operation) const;

  std::shared_ptr<db::sqlite::SqliteDB> db_;
  db::sql::Identifier                   name_;
  db::sql::TableQueries                 queries_;
};

} // namespace expiringdict::core
