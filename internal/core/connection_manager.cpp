#include "connection_manager.hpp"

#include "internal/observability/logging.hpp"

namespace expiringdict::core {

using observability::BoolField;
using observability::StringField;

ConnectionManager::ConnectionManager(db::sqlite::OpenOptions options, bool keep_open)
    : options_(std::move(options)), keep_open_(keep_open) {
}

ConnectionManager::~ConnectionManager() {
  Close();
}

std::shared_ptr<db::sqlite::SqliteDB> ConnectionManager::Acquire() {
  if (!db_) {
    db_ = std::make_shared<db::sqlite::SqliteDB>(options_);
    EXPIRINGDICT_LOG_DEBUG("opened database",
                           {StringField("path", options_.path), BoolField("read_only", options_.read_only)});
  }
  return db_;
}

void ConnectionManager::Release() {
  if (!keep_open_) Close();
}

void ConnectionManager::Close() {
  if (!db_) return;

  try {
    db_->Optimize();
  } catch (const std::exception& e) {
    EXPIRINGDICT_LOG_WARN("optimize before close failed",
                          {StringField("path", options_.path), StringField("error", e.what())});
  }

  db_.reset();
  EXPIRINGDICT_LOG_DEBUG("closed database", {StringField("path", options_.path)});
}

} // namespace expiringdict::core
