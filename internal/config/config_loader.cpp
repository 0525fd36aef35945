#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <stdexcept>

#include "internal/util/yaml_value.hpp"

namespace fleet::config {

namespace {

constexpr char     kDefaultArgsEnvVar[]    = "ANSIBLE_MODULE_ARGS";
constexpr char     kDefaultRootGroup[]     = "all";
constexpr char     kDefaultUngroupedName[] = "ungrouped";
constexpr char     kDefaultServiceName[]   = "fleet";
constexpr uint64_t kDefaultTimeoutMs       = 30000;
constexpr uint64_t kDefaultKillGraceMs     = 500;
constexpr uint32_t kDefaultMaxParallel     = 8;

} // namespace

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

void ConfigLoader::ApplyDefaults(fleet::runtime::config::RuntimeConfig* config) {
  auto* invocation = config->mutable_invocation();
  if (invocation->args_env_var().empty()) invocation->set_args_env_var(kDefaultArgsEnvVar);
  if (!invocation->default_timeout_ms()) invocation->set_default_timeout_ms(kDefaultTimeoutMs);
  if (!invocation->kill_grace_ms()) invocation->set_kill_grace_ms(kDefaultKillGraceMs);
  if (!invocation->max_parallel()) invocation->set_max_parallel(kDefaultMaxParallel);

  auto* inventory = config->mutable_inventory();
  if (inventory->root_group().empty()) inventory->set_root_group(kDefaultRootGroup);
  if (inventory->ungrouped_group().empty()) inventory->set_ungrouped_group(kDefaultUngroupedName);
  if (!inventory->script_timeout_ms()) inventory->set_script_timeout_ms(invocation->default_timeout_ms());

  auto* observability = config->mutable_observability();
  if (observability->service_name().empty()) observability->set_service_name(kDefaultServiceName);
}

fleet::runtime::config::RuntimeConfig ConfigLoader::Defaults() {
  fleet::runtime::config::RuntimeConfig config;
  ApplyDefaults(&config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

fleet::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  fleet::runtime::config::RuntimeConfig config;

  // an empty file is a valid "all defaults" config
  if (!yaml.IsNull()) {
    google::protobuf::Value json_value;
    fleet::util::YamlToProtoValue(yaml, &json_value);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

    if (!status.ok()) {
      throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
    }
  }

  ApplyDefaults(&config);
  return config;
}

} // namespace fleet::config
