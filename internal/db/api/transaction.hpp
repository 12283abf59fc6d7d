#pragma once

namespace expiringdict::db {

/*
  Abstract transaction.

  Semantics:

  - Changes are invisible to other connections until Commit()
  - Rollback() discards all writes
  - Commit()/Rollback() end the transaction; neither may be called twice
  - Destructor MUST rollback if the transaction is still open, and must
    not throw
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;
};

}
