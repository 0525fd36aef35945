#include "inventory_resolver.hpp"

#include "internal/inventory/inventory_merge.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace fleet::inventory {

InventoryResolver::InventoryResolver(ResolverOptions options, std::shared_ptr<const SourceLoader> loader)
    : options_(std::move(options)), loader_(std::move(loader)), cache_(options_.cache_ttl) {
}

std::shared_ptr<const ResolvedInventory> InventoryResolver::Resolve(const std::vector<InventorySource>& sources) {
  observability::SpanScope span("fleet.inventory.resolve");
  span.SetAttribute("sources", static_cast<std::int64_t>(sources.size()));

  fleet::v1::Inventory merged;

  for (const auto& source : sources) {
    try {
      auto inventory = cache_.GetOrLoad(source, [this](const InventorySource& s) { return loader_->Load(s); });
      MergeInventory(&merged, inventory);
    } catch (const util::InventorySourceError& e) {
      if (!options_.continue_on_source_error) {
        span.RecordException(e.what());
        throw;
      }
      span.AddEvent("source_skipped");
      FLEET_LOG_WARN("Skipping inventory source", {observability::StringField("source", e.source()),
                                                   observability::StringField("error", e.what())});
    }
  }

  AssignUngrouped(&merged, options_.root_group, options_.ungrouped_group);

  std::shared_ptr<const ResolvedInventory> resolved;
  try {
    resolved = std::make_shared<const ResolvedInventory>(std::move(merged), options_.root_group);
  } catch (const util::InventoryCycleError& e) {
    span.RecordException(e.what());
    throw;
  }
  span.SetAttribute("hosts", static_cast<std::int64_t>(resolved->Hosts().size()));
  FLEET_LOG_DEBUG("Inventory resolved", {observability::IntField("sources", static_cast<int64_t>(sources.size())),
                                         observability::IntField("hosts", static_cast<int64_t>(resolved->Hosts().size()))});
  return resolved;
}

void InventoryResolver::Refresh() {
  cache_.Clear();
}

} // namespace fleet::inventory
