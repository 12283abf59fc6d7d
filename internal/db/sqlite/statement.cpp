#include "statement.hpp"

#include <utility>

#include "internal/util/errors.hpp"

namespace expiringdict::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw util::DatabaseError(std::string(what) + ": " + sqlite3_errmsg(db), rc);
  }
}

Statement::Statement(sqlite3* db, const std::string& sql) : db_(db) {
  int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &stmt_, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = std::string("sqlite prepare: ") + sqlite3_errmsg(db_);
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
    throw util::DatabaseError(msg, rc);
  }
}

Statement::~Statement() {
  if (stmt_) sqlite3_finalize(stmt_);
}

Statement::Statement(Statement&& other) noexcept
    : db_(std::exchange(other.db_, nullptr)), stmt_(std::exchange(other.stmt_, nullptr)) {
}

Statement& Statement::operator=(Statement&& other) noexcept {
  if (this != &other) {
    if (stmt_) sqlite3_finalize(stmt_);
    db_   = std::exchange(other.db_, nullptr);
    stmt_ = std::exchange(other.stmt_, nullptr);
  }
  return *this;
}

Statement& Statement::BindText(int idx, std::string_view text) {
  ThrowIf(sqlite3_bind_text(stmt_, idx, text.data(), static_cast<int>(text.size()), SQLITE_TRANSIENT), db_,
          "sqlite bind text");
  return *this;
}

Statement& Statement::BindBlob(int idx, std::string_view bytes) {
  // a zero-length blob still needs a non-null pointer or sqlite binds NULL
  static const char kEmpty = 0;
  const char*       data   = bytes.empty() ? &kEmpty : bytes.data();
  ThrowIf(sqlite3_bind_blob(stmt_, idx, data, static_cast<int>(bytes.size()), SQLITE_TRANSIENT), db_,
          "sqlite bind blob");
  return *this;
}

Statement& Statement::BindInt64(int idx, int64_t value) {
  ThrowIf(sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(value)), db_, "sqlite bind int64");
  return *this;
}

bool Statement::Step() {
  int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw util::DatabaseError(std::string("sqlite step: ") + sqlite3_errmsg(db_), rc);
}

void Statement::Run() {
  while (Step()) {
  }
}

std::string Statement::ColumnText(int col) const {
  const unsigned char* t = sqlite3_column_text(stmt_, col);
  if (!t) return {};
  return std::string(reinterpret_cast<const char*>(t), static_cast<size_t>(sqlite3_column_bytes(stmt_, col)));
}

std::string Statement::ColumnBlob(int col) const {
  // legacy files may hold TEXT values; column_blob returns their bytes too
  const void* b = sqlite3_column_blob(stmt_, col);
  if (!b) return {};
  return std::string(static_cast<const char*>(b), static_cast<size_t>(sqlite3_column_bytes(stmt_, col)));
}

int64_t Statement::ColumnInt64(int col) const {
  return static_cast<int64_t>(sqlite3_column_int64(stmt_, col));
}

} // namespace expiringdict::db::sqlite
