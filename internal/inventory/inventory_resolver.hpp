#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "internal/inventory/inventory_source.hpp"
#include "internal/inventory/resolved_inventory.hpp"
#include "internal/inventory/source_cache.hpp"

namespace fleet::inventory {

struct ResolverOptions {
  std::string root_group      = "all";
  std::string ungrouped_group = "ungrouped";

  // Skip (and log) a failing source instead of failing the pass.
  bool continue_on_source_error = false;

  // zero = keep dynamic sources for the whole pass
  std::chrono::milliseconds cache_ttl{0};
};

/*
  InventoryResolver

  Builds a ResolvedInventory from an ordered list of sources: each source is
  loaded (memoized per pass), merged in order with later sources taking
  precedence, orphan hosts are placed in the ungrouped group and the group
  graph is validated.
*/
class InventoryResolver {
 public:
  InventoryResolver(ResolverOptions options, std::shared_ptr<const SourceLoader> loader);

  // Throws util::InventorySourceError, util::InventoryCycleError.
  std::shared_ptr<const ResolvedInventory> Resolve(const std::vector<InventorySource>& sources);

  // Starts a new pass: every source is loaded again on the next Resolve.
  void Refresh();

  const ResolverOptions& options() const {
    return options_;
  }

  const SourceCache& cache() const {
    return cache_;
  }

 private:
  ResolverOptions                     options_;
  std::shared_ptr<const SourceLoader> loader_;
  SourceCache                         cache_;
};

} // namespace fleet::inventory
