#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include "connection.hpp"
#include "connection_manager.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/observability/logging.hpp"
#include "internal/serializer/compressed_serializer.hpp"
#include "options.hpp"

namespace expiringdict::core {

/*
  Transaction lifecycle around a Connection.

    idle --Enter()--> open handle, BEGIN <mode>, migrate --> entered
    entered --Commit()/Rollback()--> COMMIT|ROLLBACK, release handle --> idle

  A Session can be entered again after it returns to idle, never while
  entered (ReentrancyViolation). Enter() surfaces every open failure
  (DirectoryNotFound, IncompatibleFile, UnsupportedSchema, sqlite
  errors) before a Connection exists; if it throws the session is idle
  again and the transaction, if begun, has been rolled back.

  Not thread-safe: one Session per thread. Concurrent access to the same
  file goes through separate Sessions and sqlite's locking.
*/
template <serializer::Serializer S = serializer::DefaultSerializer>
class Session {
 public:
  using value_type = typename S::value_type;

  explicit Session(SessionOptions options, S serializer = S{})
      : options_(std::move(options)),
        table_(options_.table),
        serializer_(std::move(serializer)),
        lifespan_(options_.lifespan),
        connections_(db::sqlite::OpenOptions{options_.path, options_.read_only, options_.busy_timeout_ms},
                     options_.keep_open) {
  }

  ~Session() {
    if (IsEntered()) {
      connection_.reset();
      try {
        transaction_->Rollback();
      } catch (const std::exception& e) {
        EXPIRINGDICT_LOG_ERROR("rollback of abandoned session failed",
                               {observability::StringField("path", options_.path),
                                observability::StringField("error", e.what())});
      }
      transaction_.reset();
    }
  }

  Session(const Session&)            = delete;
  Session& operator=(const Session&) = delete;

  Connection<S>& Enter() {
    if (IsEntered()) {
      throw util::ReentrancyViolation("session on " + options_.path + " is already entered");
    }

    auto db = connections_.Acquire();
    try {
      // a read-only handle cannot take the write lock IMMEDIATE/EXCLUSIVE ask for
      const auto mode = options_.read_only ? db::sqlite::TransactionMode::kDeferred : options_.transaction_mode;
      auto       tx   = std::make_unique<db::sqlite::SqliteTransaction>(db, mode);
      connection_.emplace(db, table_, serializer_, lifespan_);
      transaction_ = std::move(tx);
    } catch (...) {
      connection_.reset();
      db.reset();
      connections_.Release();
      throw;
    }
    return *connection_;
  }

  void Commit() {
    Finish(true);
  }

  void Rollback() {
    Finish(false);
  }

  bool IsEntered() const {
    return transaction_ != nullptr;
  }

  // true between entries only with keep_open
  bool IsHandleOpen() const {
    return connections_.IsOpen();
  }

  // Enter, fn(connection), Commit. Rolls back and rethrows if fn throws;
  // a failing rollback is logged and the original exception still wins.
  template <typename F>
  auto Run(F&& fn) {
    auto& connection = Enter();
    try {
      if constexpr (std::is_void_v<std::invoke_result_t<F, Connection<S>&>>) {
        std::invoke(std::forward<F>(fn), connection);
        Commit();
      } else {
        auto result = std::invoke(std::forward<F>(fn), connection);
        Commit();
        return result;
      }
    } catch (...) {
      if (IsEntered()) {
        try {
          Rollback();
        } catch (const std::exception& e) {
          EXPIRINGDICT_LOG_ERROR("rollback after failed run failed",
                                 {observability::StringField("path", options_.path),
                                  observability::StringField("error", e.what())});
        }
      }
      throw;
    }
  }

  // optimize and close a kept-open handle; fails if entered
  void Close() {
    if (IsEntered()) {
      throw util::ReentrancyViolation("cannot close session on " + options_.path + " while entered");
    }
    connections_.Close();
  }

  // applies to Connections created by later Enter() calls
  util::Lifespan Lifespan() const {
    return lifespan_;
  }

  void SetLifespan(util::Lifespan lifespan) {
    lifespan_ = lifespan;
  }

  const SessionOptions& Options() const {
    return options_;
  }

 private:
  void Finish(bool commit) {
    if (!IsEntered()) {
      throw std::logic_error("session on " + options_.path + " is not entered");
    }

    connection_.reset();
    auto tx = std::move(transaction_);
    try {
      if (commit) {
        tx->Commit();
      } else {
        tx->Rollback();
      }
    } catch (...) {
      // a failed COMMIT leaves the transaction open; tx's destructor rolls it back
      tx.reset();
      connections_.Release();
      throw;
    }
    tx.reset();
    connections_.Release();
  }

  SessionOptions                   options_;
  db::sql::Identifier              table_;
  S                                serializer_;
  util::Lifespan                   lifespan_;
  ConnectionManager                connections_;
  std::unique_ptr<db::Transaction> transaction_;
  std::optional<Connection<S>>     connection_;
};

/*
  RAII guard for one Session entry.

  Commit() must be called explicitly; a Scope destroyed without it
  (early return, exception) rolls the transaction back.
*/
template <serializer::Serializer S = serializer::DefaultSerializer>
class Scope {
 public:
  explicit Scope(Session<S>& session) : session_(session), connection_(&session.Enter()) {
  }

  ~Scope() {
    if (!finished_) {
      try {
        session_.Rollback();
      } catch (const std::exception& e) {
        EXPIRINGDICT_LOG_ERROR("scope rollback failed",
                               {observability::StringField("path", session_.Options().path),
                                observability::StringField("error", e.what())});
      }
    }
  }

  Scope(const Scope&)            = delete;
  Scope& operator=(const Scope&) = delete;

  Connection<S>& operator*() const {
    return *connection_;
  }

  Connection<S>* operator->() const {
    return connection_;
  }

  void Commit() {
    finished_ = true;
    session_.Commit();
  }

  void Rollback() {
    finished_ = true;
    session_.Rollback();
  }

 private:
  Session<S>&    session_;
  Connection<S>* connection_;
  bool           finished_ = false;
};

} // namespace expiringdict::core
