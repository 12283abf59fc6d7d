#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace expiringdict::db::sqlite {

/*
  RAII prepared statement.

  Finalized on destruction. Step() throws util::DatabaseError on any
  result other than SQLITE_ROW / SQLITE_DONE, so callers never see raw
  sqlite codes.
*/
class Statement {
 public:
  Statement(sqlite3* db, const std::string& sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  Statement(Statement&& other) noexcept;
  Statement& operator=(Statement&& other) noexcept;

  // parameter indexes are 1-based, as in sqlite
  Statement& BindText(int idx, std::string_view text);
  Statement& BindBlob(int idx, std::string_view bytes);
  Statement& BindInt64(int idx, int64_t value);

  // true when a row is available, false once the statement is done
  bool Step();

  // Step() for statements that return no rows
  void Run();

  // column indexes are 0-based, as in sqlite
  std::string ColumnText(int col) const;
  std::string ColumnBlob(int col) const;
  int64_t     ColumnInt64(int col) const;

 private:
  sqlite3*      db_   = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

} // namespace expiringdict::db::sqlite
