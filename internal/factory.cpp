#include "factory.hpp"

#include <chrono>

namespace fleet::factory {

Application Build(const fleet::runtime::config::RuntimeConfig& config) {
  Application app;
  app.config = config;

  const auto& invocation_config = config.invocation();
  const auto& inventory_config  = config.inventory();

  // ------------------------------------------------------------------
  // Module invocation
  // ------------------------------------------------------------------
  invoke::ChannelOptions channel_options;
  channel_options.args_env_var = invocation_config.args_env_var();
  channel_options.kill_grace   = std::chrono::milliseconds(invocation_config.kill_grace_ms());

  app.channel = std::make_shared<const invoke::ModuleChannel>(channel_options);
  app.pool    = std::make_shared<invoke::InvocationPool>(app.channel, invocation_config.max_parallel());

  // ------------------------------------------------------------------
  // Inventory
  // ------------------------------------------------------------------
  inventory::ResolverOptions resolver_options;
  resolver_options.root_group               = inventory_config.root_group();
  resolver_options.ungrouped_group          = inventory_config.ungrouped_group();
  resolver_options.continue_on_source_error = inventory_config.continue_on_source_error();
  resolver_options.cache_ttl                = std::chrono::milliseconds(inventory_config.cache_ttl_ms());

  auto loader  = std::make_shared<const inventory::SourceLoader>(app.channel, app.pool);
  app.resolver = std::make_shared<inventory::InventoryResolver>(resolver_options, loader);

  const auto script_timeout = std::chrono::milliseconds(inventory_config.script_timeout_ms());
  for (const auto& path : inventory_config.sources()) {
    app.sources.push_back(inventory::SourceFromPath(path, script_timeout));
  }

  return app;
}

} // namespace fleet::factory
