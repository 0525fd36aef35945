#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "fleet_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigIsLoaded() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
invocation:
  args_env_var: FLEET_ARGS
  default_timeout_ms: 1500
  kill_grace_ms: 100
  max_parallel: 3
inventory:
  root_group: everything
  ungrouped_group: loose
  cache_ttl_ms: 60000
  continue_on_source_error: true
  script_timeout_ms: 2500
  sources:
    - /etc/fleet/hosts.yml
    - /etc/fleet/cloud.sh
observability:
  tracing_enabled: true
  otlp_endpoint: http://collector:4318/v1/traces
  transport: OTLP_TRANSPORT_HTTP
)");

  auto config = fleet::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.invocation().args_env_var() == "FLEET_ARGS");
  assert(config.invocation().default_timeout_ms() == 1500);
  assert(config.invocation().kill_grace_ms() == 100);
  assert(config.invocation().max_parallel() == 3);
  assert(config.inventory().root_group() == "everything");
  assert(config.inventory().ungrouped_group() == "loose");
  assert(config.inventory().cache_ttl_ms() == 60000);
  assert(config.inventory().continue_on_source_error());
  assert(config.inventory().script_timeout_ms() == 2500);
  assert(config.inventory().sources_size() == 2);
  assert(config.inventory().sources(1) == "/etc/fleet/cloud.sh");
  assert(config.observability().tracing_enabled());
  assert(config.observability().otlp_endpoint() == "http://collector:4318/v1/traces");
  assert(config.observability().transport() == fleet::runtime::config::OTLP_TRANSPORT_HTTP);
  assert(config.observability().service_name() == "fleet");
}

void TestMissingValuesGetDefaults() {
  const auto yaml_path = WriteYaml("partial",
                                   R"(invocation:
  default_timeout_ms: 4000
)");

  auto config = fleet::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.invocation().args_env_var() == "ANSIBLE_MODULE_ARGS");
  assert(config.invocation().default_timeout_ms() == 4000);
  assert(config.invocation().kill_grace_ms() == 500);
  assert(config.invocation().max_parallel() == 8);
  assert(config.inventory().root_group() == "all");
  assert(config.inventory().ungrouped_group() == "ungrouped");
  // script timeout follows the invocation default
  assert(config.inventory().script_timeout_ms() == 4000);
  assert(!config.inventory().continue_on_source_error());
  assert(!config.observability().tracing_enabled());
}

void TestEmptyFileIsAllDefaults() {
  const auto yaml_path = WriteYaml("empty", "");

  auto config   = fleet::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  auto defaults = fleet::config::ConfigLoader::Defaults();
  assert(config.SerializeAsString() == defaults.SerializeAsString());
  assert(config.invocation().default_timeout_ms() == 30000);
}

void TestQuotedScalarsStayStrings() {
  const auto yaml_path = WriteYaml("quoted",
                                   R"(invocation:
  args_env_var: "123"
inventory:
  sources:
    - "C:\\fleet\\\"quoted\"\\hosts.json"
    - "line1\nline2☃"
)");

  auto config = fleet::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.invocation().args_env_var() == "123");
  assert(config.inventory().sources(0) == "C:\\fleet\\\"quoted\"\\hosts.json");
  assert(config.inventory().sources(1) == std::string("line1\nline2☃"));
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(invocation:
  max_parallel: 2
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)fleet::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileThrows() {
  bool threw = false;
  try {
    (void)fleet::config::ConfigLoader::LoadFromYaml("/nonexistent/fleet.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigIsLoaded();
  TestMissingValuesGetDefaults();
  TestEmptyFileIsAllDefaults();
  TestQuotedScalarsStayStrings();
  TestUnknownFieldsAreRejected();
  TestMissingFileThrows();

  std::cout << "fleet_unit_config_loader: pass\n";
  return 0;
}
