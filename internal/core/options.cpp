#include "options.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace expiringdict::core {

using expiringdict::runtime::config::TransactionMode;

static db::sqlite::TransactionMode FromProto(TransactionMode mode) {
  switch (mode) {
    case expiringdict::runtime::config::TRANSACTION_MODE_DEFERRED:
      return db::sqlite::TransactionMode::kDeferred;
    case expiringdict::runtime::config::TRANSACTION_MODE_EXCLUSIVE:
      return db::sqlite::TransactionMode::kExclusive;
    case expiringdict::runtime::config::TRANSACTION_MODE_IMMEDIATE:
    case expiringdict::runtime::config::TRANSACTION_MODE_UNSPECIFIED:
    default:
      return db::sqlite::TransactionMode::kImmediate;
  }
}

SessionOptions OptionsFromConfig(const expiringdict::runtime::config::StoreConfig& config) {
  if (config.path().empty()) {
    throw std::runtime_error("Invalid configuration: store.path is required");
  }

  SessionOptions options;
  options.path = config.path();
  if (!config.table().empty()) {
    options.table = config.table();
  }
  if (config.has_lifespan()) {
    options.lifespan = util::FromProto(config.lifespan());
  }
  options.transaction_mode = FromProto(config.transaction_mode());
  options.read_only        = config.read_only();
  if (config.busy_timeout_ms() != 0) {
    options.busy_timeout_ms =
        static_cast<int>(std::min<uint32_t>(config.busy_timeout_ms(), std::numeric_limits<int>::max()));
  }
  options.keep_open = config.keep_open();
  return options;
}

} // namespace expiringdict::core
