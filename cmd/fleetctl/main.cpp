#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "fleet/v1.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/invoke/args_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"

namespace {

void Usage() {
  std::cerr << "Usage:\n"
            << "  fleetctl [--config <file>] inventory [-i <source>]... --list\n"
            << "  fleetctl [--config <file>] inventory [-i <source>]... --host <name>\n"
            << "  fleetctl [--config <file>] inventory [-i <source>]... --pattern <pattern>\n"
            << "  fleetctl [--config <file>] invoke <module> [<json-args>] [--timeout-ms <ms>]\n";
}

struct InventoryCommand {
  std::vector<std::string>   sources;
  std::optional<std::string> host;
  std::optional<std::string> pattern;
  bool                       list = false;
};

struct InvokeCommand {
  std::string                module;
  std::string                arguments;
  std::optional<uint64_t>    timeout_ms;
};

std::optional<InventoryCommand> ParseInventory(const std::vector<std::string>& args) {
  InventoryCommand cmd;
  for (size_t i = 0; i < args.size(); ++i) {
    const auto& arg  = args[i];
    const bool  more = i + 1 < args.size();
    if ((arg == "-i" || arg == "--inventory") && more) {
      cmd.sources.push_back(args[++i]);
    } else if (arg == "--list") {
      cmd.list = true;
    } else if (arg == "--host" && more) {
      cmd.host = args[++i];
    } else if (arg == "--pattern" && more) {
      cmd.pattern = args[++i];
    } else {
      return std::nullopt;
    }
  }

  const int modes = (cmd.list ? 1 : 0) + (cmd.host ? 1 : 0) + (cmd.pattern ? 1 : 0);
  if (modes > 1) return std::nullopt;
  // no mode behaves like --list, as the dynamic inventory contract requires
  if (modes == 0) cmd.list = true;
  return cmd;
}

std::optional<InvokeCommand> ParseInvoke(const std::vector<std::string>& args) {
  InvokeCommand cmd;
  for (size_t i = 0; i < args.size(); ++i) {
    const auto& arg = args[i];
    if (arg == "--timeout-ms" && i + 1 < args.size()) {
      cmd.timeout_ms = fleet::util::ParseMillis(args[++i]);
      if (!cmd.timeout_ms) {
        std::cerr << "--timeout-ms expects a number of milliseconds, got '" << args[i] << "'\n";
        return std::nullopt;
      }
    } else if (cmd.module.empty()) {
      cmd.module = arg;
    } else if (cmd.arguments.empty()) {
      cmd.arguments = arg;
    } else {
      return std::nullopt;
    }
  }
  if (cmd.module.empty()) return std::nullopt;
  return cmd;
}

int RunInventory(fleet::factory::Application& app, const InventoryCommand& cmd) {
  auto sources = app.sources;
  if (!cmd.sources.empty()) {
    sources.clear();
    const auto timeout = std::chrono::milliseconds(app.config.inventory().script_timeout_ms());
    for (const auto& path : cmd.sources) sources.push_back(fleet::inventory::SourceFromPath(path, timeout));
  }

  auto resolved = app.resolver->Resolve(sources);

  if (cmd.host) {
    std::cout << fleet::util::ToJson(resolved->HostVars(*cmd.host), true) << std::endl;
    return 0;
  }

  if (cmd.pattern) {
    google::protobuf::ListValue hosts;
    for (const auto& host : resolved->MatchHosts(*cmd.pattern)) hosts.add_values()->set_string_value(host);
    std::cout << fleet::util::ToJson(hosts, true) << std::endl;
    return 0;
  }

  std::cout << fleet::util::ToJson(resolved->ToListDocument(), true) << std::endl;
  return 0;
}

int RunInvoke(fleet::factory::Application& app, const InvokeCommand& cmd) {
  const fleet::v1::Struct arguments = fleet::invoke::ArgsCodec::DecodeStrict(cmd.arguments);
  const auto timeout   = std::chrono::milliseconds(cmd.timeout_ms.value_or(app.config.invocation().default_timeout_ms()));

  const fleet::v1::ModuleCallResult result = app.channel->Invoke(cmd.module, arguments, timeout);
  std::cout << fleet::util::ToJson(result, true) << std::endl;
  return fleet::invoke::Succeeded(result) ? 0 : 2;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::string config_path;
  if (args.size() >= 2 && args[0] == "--config") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }

  if (args.empty()) {
    Usage();
    return 1;
  }

  const std::string command = args.front();
  args.erase(args.begin());

  std::optional<InventoryCommand> inventory_cmd;
  std::optional<InvokeCommand>    invoke_cmd;
  if (command == "inventory") {
    inventory_cmd = ParseInventory(args);
  } else if (command == "invoke") {
    invoke_cmd = ParseInvoke(args);
  }
  if (!inventory_cmd && !invoke_cmd) {
    Usage();
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config_path.empty() ? fleet::config::ConfigLoader::Defaults() : fleet::config::ConfigLoader::LoadFromYaml(config_path);

    fleet::observability::InitializeLogging(config);
    if (fleet::observability::InitializeTracing(config)) {
      FLEET_LOG_DEBUG("Tracing enabled", {fleet::observability::StringField("endpoint", config.observability().otlp_endpoint())});
    }

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = fleet::factory::Build(config);

    const int rc = inventory_cmd ? RunInventory(app, *inventory_cmd) : RunInvoke(app, *invoke_cmd);

    app.pool->Stop();
    fleet::observability::ShutdownTracing();
    fleet::observability::ShutdownLogging();
    return rc;
  } catch (const fleet::util::InventoryCycleError& e) {
    FLEET_LOG_ERROR("Inventory cycle", {fleet::observability::StringField("cycle", e.cycle())});
  } catch (const fleet::util::InventorySourceError& e) {
    FLEET_LOG_ERROR("Inventory source failed", {fleet::observability::StringField("source", e.source()),
                                                fleet::observability::StringField("error", e.what())});
  } catch (const std::exception& e) {
    FLEET_LOG_ERROR("Fatal error", {fleet::observability::StringField("error", e.what())});
  }

  fleet::observability::ShutdownTracing();
  fleet::observability::ShutdownLogging();
  return 2;
}
