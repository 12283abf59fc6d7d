#include "sqlite_db.hpp"

#include <filesystem>

#include "internal/util/errors.hpp"

namespace expiringdict::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw util::DatabaseError(std::string(what) + ": " + sqlite3_errmsg(db), rc);
  }
}

// in-memory, temporary and URI databases have no directory to check
static bool IsPlainFilePath(const std::string& path) {
  return !path.empty() && path != ":memory:" && path.rfind("file:", 0) != 0;
}

static void CheckDirectory(const std::string& path) {
  if (!IsPlainFilePath(path)) return;

  const auto parent = std::filesystem::path(path).parent_path();
  if (parent.empty()) return;

  std::error_code ec;
  if (!std::filesystem::is_directory(parent, ec)) {
    throw util::DirectoryNotFound("directory does not exist: " + parent.string());
  }
}

SqliteDB::SqliteDB(OpenOptions options) : options_(std::move(options)) {
  CheckDirectory(options_.path);

  const int flags = options_.read_only ? SQLITE_OPEN_READONLY : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
  int       rc    = sqlite3_open_v2(options_.path.c_str(), &db_, flags | SQLITE_OPEN_URI, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::DatabaseError("sqlite open " + options_.path + ": " + msg, rc);
  }

  try {
    Configure();
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close_v2(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw util::DatabaseError(msg, rc);
  }
}

Statement SqliteDB::Prepare(const std::string& sql) {
  return Statement(db_, sql);
}

int64_t SqliteDB::QueryInt64(const std::string& sql) {
  auto st = Prepare(sql);
  if (!st.Step()) {
    throw util::DatabaseError("no result for: " + sql, SQLITE_ERROR);
  }
  return st.ColumnInt64(0);
}

int SqliteDB::Changes() const {
  return sqlite3_changes(db_);
}

void SqliteDB::Configure() {
  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, options_.busy_timeout_ms), db_, "busy_timeout");

  // a read-only handle can neither switch journal mode nor needs to
  if (options_.read_only) return;

  // IMPORTANT: WAL enables concurrent readers while writer holds lock
  Exec("PRAGMA journal_mode=WAL;");

  // NORMAL is a good tradeoff; use FULL if you want stronger durability
  Exec("PRAGMA synchronous=NORMAL;");
}

void SqliteDB::Optimize() {
  if (options_.read_only) return;
  Exec("PRAGMA analysis_limit=8192;");
  Exec("PRAGMA optimize;");
}

} // namespace expiringdict::db::sqlite
