#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <variant>

#include "fleet/v1/inventory.pb.h"

namespace fleet::invoke {
class ModuleChannel;
class InvocationPool;
}

namespace fleet::inventory {

// JSON or YAML file in the --list shape.
struct StaticSource {
  std::string path;
};

// Executable implementing --list / --host <name>.
struct ScriptSource {
  std::string               path;
  std::chrono::milliseconds timeout{0};
};

// Directory with a hosts file plus group_vars/<group> and host_vars/<host>.
struct DirectorySource {
  std::string path;
};

using InventorySource = std::variant<StaticSource, ScriptSource, DirectorySource>;

// Directories become DirectorySource, executable regular files ScriptSource,
// anything else StaticSource.
InventorySource SourceFromPath(const std::string& path, std::chrono::milliseconds script_timeout);

const std::string& SourcePath(const InventorySource& source);

// Stable cache key, e.g. "script:/etc/fleet/ec2.sh".
std::string SourceKey(const InventorySource& source);

/*
  SourceLoader

  Turns one source into an Inventory. Dynamic sources go through the module
  invocation channel; their --host fallback fans out on the pool. Every
  failure surfaces as util::InventorySourceError, including the OS refusing
  to start a script.
*/
class SourceLoader {
 public:
  SourceLoader(std::shared_ptr<const fleet::invoke::ModuleChannel> channel, std::shared_ptr<fleet::invoke::InvocationPool> pool);

  fleet::v1::Inventory Load(const InventorySource& source) const;

 private:
  fleet::v1::Inventory LoadStatic(const StaticSource& source) const;
  fleet::v1::Inventory LoadScript(const ScriptSource& source) const;
  fleet::v1::Inventory LoadDirectory(const DirectorySource& source) const;
  void                 FetchHostVars(const ScriptSource& source, fleet::v1::Inventory* inventory) const;

  std::shared_ptr<const fleet::invoke::ModuleChannel> channel_;
  std::shared_ptr<fleet::invoke::InvocationPool>      pool_;
};

} // namespace fleet::inventory
