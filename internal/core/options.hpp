#pragma once

#include <chrono>
#include <string>

#include "config/config.pb.h"
#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/util/time.hpp"

namespace expiringdict::core {

inline constexpr const char* kDefaultTable = "expiringsqlitedict";

inline constexpr util::Lifespan kDefaultLifespan = std::chrono::hours(24 * 7);

struct SessionOptions {
  std::string                 path;
  std::string                 table            = kDefaultTable;
  util::Lifespan              lifespan         = kDefaultLifespan;
  db::sqlite::TransactionMode transaction_mode = db::sqlite::TransactionMode::kImmediate;
  bool                        read_only        = false;
  int                         busy_timeout_ms  = 5000;

  // keep the sqlite handle between sessions instead of closing on exit
  bool keep_open = false;
};

// unset config fields keep the SessionOptions defaults
SessionOptions OptionsFromConfig(const expiringdict::runtime::config::StoreConfig& config);

} // namespace expiringdict::core
