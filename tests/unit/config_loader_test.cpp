#include "internal/config/config_loader.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

#include "internal/core/options.hpp"

namespace {

using expiringdict::config::ConfigLoader;
using expiringdict::core::OptionsFromConfig;
using expiringdict::db::sqlite::TransactionMode;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "expiringdict_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullStoreConfig() {
  const auto yaml_path = WriteYaml("full",
                                   R"(store:
  path: "/var/cache/app/cache.db"
  table: sessions
  lifespan: 3600s
  transaction_mode: TRANSACTION_MODE_EXCLUSIVE
  read_only: false
  busy_timeout_ms: 250
  keep_open: true
  serializer: SERIALIZER_KIND_JSON
logging:
  level: debug
  pattern: "%v"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.store().path() == "/var/cache/app/cache.db");
  assert(config.store().table() == "sessions");
  assert(config.store().lifespan().seconds() == 3600);
  assert(config.store().transaction_mode() == expiringdict::runtime::config::TRANSACTION_MODE_EXCLUSIVE);
  assert(config.store().busy_timeout_ms() == 250);
  assert(config.store().keep_open());
  assert(config.store().serializer() == expiringdict::runtime::config::SERIALIZER_KIND_JSON);
  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "%v");

  auto options = OptionsFromConfig(config.store());
  assert(options.path == "/var/cache/app/cache.db");
  assert(options.table == "sessions");
  assert(options.lifespan == std::chrono::hours(1));
  assert(options.transaction_mode == TransactionMode::kExclusive);
  assert(options.busy_timeout_ms == 250);
  assert(options.keep_open);
  assert(!options.read_only);
}

void TestDefaultsForMissingFields() {
  auto config = ConfigLoader::LoadFromYamlString("store:\n  path: cache.db\n");

  auto options = OptionsFromConfig(config.store());
  assert(options.path == "cache.db");
  assert(options.table == "expiringsqlitedict");
  assert(options.lifespan == std::chrono::hours(24 * 7));
  assert(options.transaction_mode == TransactionMode::kImmediate);
  assert(options.busy_timeout_ms == 5000);
  assert(!options.keep_open);
}

void TestQuotedNumericTableStaysString() {
  auto config = ConfigLoader::LoadFromYamlString("store:\n  path: cache.db\n  table: \"1337\"\n");
  assert(config.store().table() == "1337");
}

void TestOversizedBusyTimeoutIsClamped() {
  auto config = ConfigLoader::LoadFromYamlString("store:\n  path: cache.db\n  busy_timeout_ms: 4294967295\n");
  assert(config.store().busy_timeout_ms() == 4294967295u);
  assert(OptionsFromConfig(config.store()).busy_timeout_ms == std::numeric_limits<int>::max());
}

void TestNegativeLifespan() {
  auto config = ConfigLoader::LoadFromYamlString("store:\n  path: cache.db\n  lifespan: -60s\n");
  assert(OptionsFromConfig(config.store()).lifespan == std::chrono::seconds(-60));
}

void TestFractionalLifespanIsRejected() {
  bool threw = false;
  try {
    ConfigLoader::LoadFromYamlString("store:\n  path: cache.db\n  lifespan: 1.5s\n");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestUnknownFieldIsRejected() {
  bool threw = false;
  try {
    ConfigLoader::LoadFromYamlString("store:\n  path: cache.db\n  ttl: 5\n");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("Invalid configuration") != std::string::npos;
  }
  assert(threw);
}

void TestMissingPathIsRejected() {
  auto config = ConfigLoader::LoadFromYamlString("logging:\n  level: warn\n");

  bool threw = false;
  try {
    OptionsFromConfig(config.store());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    ConfigLoader::LoadFromYaml("/nonexistent/expiringdict/config.yaml");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("Failed to load YAML config") != std::string::npos;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullStoreConfig();
  TestDefaultsForMissingFields();
  TestQuotedNumericTableStaysString();
  TestOversizedBusyTimeoutIsClamped();
  TestNegativeLifespan();
  TestFractionalLifespanIsRejected();
  TestUnknownFieldIsRejected();
  TestMissingPathIsRejected();
  TestMissingFileIsReported();

  std::cout << "expiringdict_unit_config_loader: pass\n";
  return 0;
}
