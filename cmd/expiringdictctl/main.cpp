#include <iostream>
#include <string>
#include <vector>

#include "commands.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"

using expiringdict::observability::StringField;

int main(int argc, char** argv) {
  if (argc < 3) {
    expiringdict::cli::PrintUsage(std::cout);
    return expiringdict::cli::kUsageError;
  }

  const std::string              config_path = argv[1];
  const std::string              cmd         = argv[2];
  const std::vector<std::string> args(argv + 3, argv + argc);

  expiringdict::runtime::config::RuntimeConfig config;
  try {
    config = expiringdict::config::ConfigLoader::LoadFromYaml(config_path);
  } catch (const std::exception& e) {
    EXPIRINGDICT_LOG_ERROR("Fatal error", {StringField("config", config_path), StringField("error", e.what())});
    return expiringdict::cli::kFailure;
  }

  expiringdict::observability::InitializeLogging(config);
  const int rc = expiringdict::cli::RunCommand(config.store(), cmd, args, std::cout, std::cerr);
  expiringdict::observability::ShutdownLogging();
  return rc;
}
