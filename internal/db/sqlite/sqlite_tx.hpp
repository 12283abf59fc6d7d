#pragma once

#include <memory>
#include <string>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace expiringdict::db::sqlite {

enum class TransactionMode {
  kDeferred,
  kImmediate,
  kExclusive,
};

const char* ToString(TransactionMode mode);

/*
  SQLite transaction wrapper.

  Default mode is BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y lock upgrades later under concurrent writers
*/
class SqliteTransaction final : public db::Transaction {
public:
  SqliteTransaction(std::shared_ptr<SqliteDB> db, TransactionMode mode = TransactionMode::kImmediate);
  ~SqliteTransaction();

  void Commit() override;
  void Rollback() override;

private:
  std::shared_ptr<SqliteDB> db_;
  bool finished_ = false;
};

}
