#include "inventory_source.hpp"

#include <unistd.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <functional>
#include <sstream>
#include <system_error>
#include <type_traits>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "internal/inventory/inventory_schema.hpp"
#include "internal/invoke/invocation_pool.hpp"
#include "internal/invoke/module_channel.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/yaml_value.hpp"
#include "internal/vars/merge.hpp"

namespace fleet::inventory {

namespace fs = std::filesystem;

namespace {

bool IsYamlPath(const std::string& path) {
  const auto ext = fs::path(path).extension().string();
  return ext == ".yml" || ext == ".yaml";
}

bool IsJsonPath(const std::string& path) {
  return fs::path(path).extension() == ".json";
}

// Files under group_vars/ and host_vars/ that hold vars.
bool IsVarsFile(const fs::path& path) {
  const auto ext = path.extension().string();
  return ext.empty() || ext == ".yml" || ext == ".yaml" || ext == ".json";
}

std::string ReadFile(const std::string& path, const std::string& origin) {
  std::ifstream in(path);
  if (!in) throw util::InventorySourceError(origin, "cannot open " + path);

  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

google::protobuf::Struct ReadYamlMapping(const std::string& path, const std::string& origin) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::InventorySourceError(origin, "failed to load YAML " + path + ": " + e.what());
  }

  if (yaml.IsNull()) return {};
  if (!yaml.IsMap()) throw util::InventorySourceError(origin, path + ": top level must be a mapping");

  google::protobuf::Value value;
  util::YamlToProtoValue(yaml, &value);
  return value.struct_value();
}

/*
  Reads a JSON or YAML mapping. The extension decides; a file without one is
  JSON when it starts with '{' and YAML otherwise.
*/
google::protobuf::Struct ReadMapping(const std::string& path, const std::string& origin) {
  if (IsYamlPath(path)) return ReadYamlMapping(path, origin);

  const auto text = ReadFile(path, origin);
  if (!IsJsonPath(path)) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    if (text[first] != '{') return ReadYamlMapping(path, origin);
  }

  std::string error;
  auto        parsed = util::ParseJsonObject(text, &error);
  if (!parsed) throw util::InventorySourceError(origin, "invalid JSON in " + path + ": " + error);
  return std::move(*parsed);
}

// Files directly under `dir`, sorted, skipping hidden entries.
std::vector<fs::path> SortedEntries(const fs::path& dir) {
  std::vector<fs::path> entries;
  for (const auto& entry : fs::directory_iterator(dir)) {
    if (entry.path().filename().string().front() == '.') continue;
    entries.push_back(entry.path());
  }
  std::sort(entries.begin(), entries.end());
  return entries;
}

/*
  Walks group_vars/ or host_vars/. Each `<name>.yml` file and each `<name>/`
  directory (whose files merge in name order) yields one vars mapping for
  `name`.
*/
void ForEachVarsEntry(const fs::path& dir, const std::string& origin,
                      const std::function<void(const std::string&, const google::protobuf::Struct&)>& apply) {
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) return;

  for (const auto& path : SortedEntries(dir)) {
    if (fs::is_directory(path, ec)) {
      google::protobuf::Struct merged;
      for (const auto& file : SortedEntries(path)) {
        if (!fs::is_regular_file(file, ec) || !IsVarsFile(file)) continue;
        vars::MergeInto(&merged, ReadMapping(file.string(), origin));
      }
      apply(path.filename().string(), merged);
    } else if (fs::is_regular_file(path, ec) && IsVarsFile(path)) {
      apply(path.stem().string(), ReadMapping(path.string(), origin));
    }
  }
}

bool IsExecutableFile(const std::string& path) {
  std::error_code ec;
  return fs::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
}

std::string Describe(const fleet::v1::ModuleCallResult& result) {
  std::string text = std::string(fleet::invoke::ErrorKindName(result.error())) + ", exit code " + std::to_string(result.exit_code());
  if (!result.msg().empty()) text += ": " + result.msg();
  if (!result.stderr().empty()) text += " (stderr: " + result.stderr() + ")";
  return text;
}

// --list / --host answers are judged on exit code and JSON, not on a "failed"
// key that could equally be a group name.
bool SourceCallFailed(const fleet::v1::ModuleCallResult& result) {
  return result.error() == fleet::v1::MODULE_ERROR_KIND_TIMEOUT || result.error() == fleet::v1::MODULE_ERROR_KIND_PROTOCOL_ERROR ||
         result.exit_code() != 0;
}

} // namespace

InventorySource SourceFromPath(const std::string& path, std::chrono::milliseconds script_timeout) {
  std::error_code ec;
  if (fs::is_directory(path, ec)) return DirectorySource{path};
  if (IsExecutableFile(path)) return ScriptSource{path, script_timeout};
  return StaticSource{path};
}

const std::string& SourcePath(const InventorySource& source) {
  return std::visit([](const auto& s) -> const std::string& { return s.path; }, source);
}

std::string SourceKey(const InventorySource& source) {
  return std::visit(
      [](const auto& s) -> std::string {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, ScriptSource>) {
          return "script:" + s.path;
        } else if constexpr (std::is_same_v<T, DirectorySource>) {
          return "dir:" + s.path;
        } else {
          return "static:" + s.path;
        }
      },
      source);
}

SourceLoader::SourceLoader(std::shared_ptr<const fleet::invoke::ModuleChannel> channel, std::shared_ptr<fleet::invoke::InvocationPool> pool)
    : channel_(std::move(channel)), pool_(std::move(pool)) {
}

fleet::v1::Inventory SourceLoader::Load(const InventorySource& source) const {
  try {
    return std::visit(
        [this](const auto& s) -> fleet::v1::Inventory {
          using T = std::decay_t<decltype(s)>;
          if constexpr (std::is_same_v<T, ScriptSource>) {
            return LoadScript(s);
          } else if constexpr (std::is_same_v<T, DirectorySource>) {
            return LoadDirectory(s);
          } else {
            return LoadStatic(s);
          }
        },
        source);
  } catch (const util::InventorySourceError&) {
    throw;
  } catch (const std::system_error& e) {
    // pipe/fork refused, or a filesystem walk failed
    throw util::InventorySourceError(SourcePath(source), e.what());
  } catch (const std::runtime_error& e) {
    // e.g. the invocation pool was stopped under a --host fan-out
    throw util::InventorySourceError(SourcePath(source), e.what());
  }
}

// ------------------------------------------------------------
// Static files
// ------------------------------------------------------------

fleet::v1::Inventory SourceLoader::LoadStatic(const StaticSource& source) const {
  auto inventory = ParseInventoryDocument(ReadMapping(source.path, source.path), source.path);
  FLEET_LOG_INFO("Loaded static inventory", {observability::StringField("source", source.path),
                                             observability::IntField("groups", inventory.groups_size())});
  return inventory;
}

// ------------------------------------------------------------
// Dynamic sources
// ------------------------------------------------------------

fleet::v1::Inventory SourceLoader::LoadScript(const ScriptSource& source) const {
  std::error_code ec;
  if (!fs::exists(source.path, ec)) {
    throw util::InventorySourceError(source.path, "script not found");
  }
  if (!IsExecutableFile(source.path)) {
    throw util::InventorySourceError(source.path, "script is not executable");
  }

  auto result = channel_->Invoke(source.path, {}, source.timeout, {"--list"});
  if (SourceCallFailed(result)) {
    throw util::InventorySourceError(source.path, "--list failed: " + Describe(result));
  }

  auto document = fleet::invoke::ExtractResultObject(result.raw_stdout());
  if (!document) {
    throw util::InventorySourceError(source.path, "--list output is not a JSON object");
  }

  auto inventory = ParseInventoryDocument(*document, source.path);

  // _meta wins: --host is only consulted when the source has no _meta at all
  if (!HasMeta(*document)) FetchHostVars(source, &inventory);

  FLEET_LOG_INFO("Loaded dynamic inventory", {observability::StringField("source", source.path),
                                              observability::IntField("groups", inventory.groups_size()),
                                              observability::BoolField("host_fallback", !HasMeta(*document))});
  return inventory;
}

void SourceLoader::FetchHostVars(const ScriptSource& source, fleet::v1::Inventory* inventory) const {
  const auto hosts = CollectHostNames(*inventory);

  std::vector<fleet::invoke::InvocationRequest> requests;
  requests.reserve(hosts.size());
  for (const auto& host : hosts) {
    fleet::invoke::InvocationRequest request;
    request.executable = source.path;
    request.timeout    = source.timeout;
    request.argv       = {"--host", host};
    requests.push_back(std::move(request));
  }

  const auto results = pool_->RunAll(std::move(requests));

  for (size_t i = 0; i < hosts.size(); ++i) {
    const auto& result = results[i];
    if (SourceCallFailed(result)) {
      throw util::InventorySourceError(source.path, "--host " + hosts[i] + " failed: " + Describe(result));
    }

    auto vars = fleet::invoke::ExtractResultObject(result.raw_stdout());
    if (!vars) {
      throw util::InventorySourceError(source.path, "--host " + hosts[i] + " output is not a JSON object");
    }
    if (!vars->fields().empty()) (*inventory->mutable_hostvars())[hosts[i]] = std::move(*vars);
  }
}

// ------------------------------------------------------------
// Inventory directories
// ------------------------------------------------------------

fleet::v1::Inventory SourceLoader::LoadDirectory(const DirectorySource& source) const {
  std::error_code ec;
  if (!fs::is_directory(source.path, ec)) {
    throw util::InventorySourceError(source.path, "not a directory");
  }

  const fs::path       root(source.path);
  fleet::v1::Inventory inventory;

  for (const char* name : {"hosts", "hosts.yml", "hosts.yaml", "hosts.json"}) {
    const auto file = root / name;
    if (!fs::is_regular_file(file, ec)) continue;
    inventory = ParseInventoryDocument(ReadMapping(file.string(), source.path), source.path);
    break;
  }

  // group_vars files override vars written inline in the hosts file
  ForEachVarsEntry(root / "group_vars", source.path, [&](const std::string& group, const google::protobuf::Struct& group_vars) {
    auto& dst = (*inventory.mutable_groups())[group];
    dst.set_name(group);
    vars::MergeInto(dst.mutable_vars(), group_vars);
  });

  const auto known = CollectHostNames(inventory);
  ForEachVarsEntry(root / "host_vars", source.path, [&](const std::string& host, const google::protobuf::Struct& host_vars) {
    if (!std::binary_search(known.begin(), known.end(), host)) {
      FLEET_LOG_DEBUG("Ignoring host_vars for unknown host", {observability::StringField("source", source.path),
                                                             observability::StringField("host", host)});
      return;
    }
    vars::MergeInto(&(*inventory.mutable_hostvars())[host], host_vars);
  });

  FLEET_LOG_INFO("Loaded inventory directory", {observability::StringField("source", source.path),
                                                observability::IntField("groups", inventory.groups_size())});
  return inventory;
}

} // namespace fleet::inventory
