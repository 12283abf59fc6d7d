#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace expiringdict::db::sqlite {

using observability::StringField;

const char* ToString(TransactionMode mode) {
  switch (mode) {
    case TransactionMode::kDeferred:
      return "DEFERRED";
    case TransactionMode::kExclusive:
      return "EXCLUSIVE";
    case TransactionMode::kImmediate:
    default:
      return "IMMEDIATE";
  }
}

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, TransactionMode mode) : db_(std::move(db)) {
  db_->Exec(std::string("BEGIN ") + ToString(mode) + " TRANSACTION;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      EXPIRINGDICT_LOG_ERROR("rollback of abandoned transaction failed",
                             {StringField("path", db_->Path()), StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  if (finished_) throw std::logic_error("transaction already finished");
  db_->Exec("COMMIT;");
  finished_ = true;
}

void SqliteTransaction::Rollback() {
  if (finished_) throw std::logic_error("transaction already finished");
  // the transaction is over even if ROLLBACK reports an error; sqlite
  // has already rolled back on most failures that make ROLLBACK fail
  finished_ = true;
  db_->Exec("ROLLBACK;");
}

} // namespace expiringdict::db::sqlite
