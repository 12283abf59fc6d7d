#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

#include "statement.hpp"

namespace expiringdict::db::sqlite {

struct OpenOptions {
  std::string path;
  bool        read_only       = false;
  int         busy_timeout_ms = 5000;
};

/*
  Thin RAII wrapper around sqlite3*.

  Opening checks that the target directory exists (sqlite's own error
  for that case is an unhelpful "unable to open database file").
*/
class SqliteDB {
 public:
  explicit SqliteDB(OpenOptions options);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  const std::string& Path() const {
    return options_.path;
  }

  bool ReadOnly() const {
    return options_.read_only;
  }

  // Execute a SQL string (used for pragmas/migrations/transaction control)
  void Exec(const std::string& sql);

  Statement Prepare(const std::string& sql);

  // single integer result, e.g. PRAGMA user_version
  int64_t QueryInt64(const std::string& sql);

  // rows modified by the most recent INSERT/UPDATE/DELETE, triggers excluded
  int Changes() const;

  // Configure recommended PRAGMAs (WAL, synchronous, busy timeout)
  void Configure();

  // Advisory statistics refresh, run before closing
  void Optimize();

 private:
  OpenOptions options_;
  sqlite3*    db_ = nullptr;
};

} // namespace expiringdict::db::sqlite
