#pragma once

#include <memory>
#include <vector>

#include "config/config.pb.h"

#include "internal/inventory/inventory_resolver.hpp"
#include "internal/invoke/invocation_pool.hpp"
#include "internal/invoke/module_channel.hpp"

namespace fleet::factory {

/*
  Application

  Owns the long-lived components. Everything here lives for the lifetime of
  the process.
*/
struct Application {
  fleet::runtime::config::RuntimeConfig config;

  std::shared_ptr<const invoke::ModuleChannel> channel;
  std::shared_ptr<invoke::InvocationPool>      pool;
  std::shared_ptr<inventory::InventoryResolver> resolver;

  // config.inventory.sources classified by SourceFromPath
  std::vector<inventory::InventorySource> sources;
};

/*
  Build

  Constructs the whole object graph from runtime config. This is the
  composition root: the only place that turns config into options.
*/
Application Build(const fleet::runtime::config::RuntimeConfig& config);

} // namespace fleet::factory
