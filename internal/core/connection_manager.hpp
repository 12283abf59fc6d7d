#pragma once

#include <memory>

#include "internal/db/sqlite/sqlite_db.hpp"

namespace expiringdict::core {

/*
  Owns the sqlite handle of a Session.

  Acquire() opens lazily (or hands back the kept handle); Release() ends
  a session's use of it and, unless keep_open, optimizes and closes it.
  Nothing here throws once a handle is open: the optimize pass is
  best-effort and its failures are logged.
*/
class ConnectionManager {
 public:
  ConnectionManager(db::sqlite::OpenOptions options, bool keep_open);
  ~ConnectionManager();

  ConnectionManager(const ConnectionManager&)            = delete;
  ConnectionManager& operator=(const ConnectionManager&) = delete;

  std::shared_ptr<db::sqlite::SqliteDB> Acquire();

  void Release();

  // optimize + close, regardless of keep_open
  void Close();

  bool IsOpen() const {
    return db_ != nullptr;
  }

 private:
  db::sqlite::OpenOptions               options_;
  bool                                  keep_open_;
  std::shared_ptr<db::sqlite::SqliteDB> db_;
};

} // namespace expiringdict::core
