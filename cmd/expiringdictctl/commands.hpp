#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "config/config.pb.h"

namespace expiringdict::cli {

constexpr int kOk         = 0;
constexpr int kUsageError = 1;
constexpr int kFailure    = 2;
constexpr int kNotFound   = 3;

void PrintUsage(std::ostream& out);

/*
  Runs one expiringdictctl command against the configured store.

  Results go to `out`, diagnostics to `err`. Never throws: failures map
  onto the exit codes above.
*/
int RunCommand(const expiringdict::runtime::config::StoreConfig& store, const std::string& cmd,
               const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

} // namespace expiringdict::cli
