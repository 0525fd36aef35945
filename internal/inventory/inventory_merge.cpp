#include "inventory_merge.hpp"

#include <unordered_set>
#include <vector>

#include "internal/inventory/inventory_schema.hpp"
#include "internal/vars/merge.hpp"

namespace fleet::inventory {

void MergeInventory(fleet::v1::Inventory* into, const fleet::v1::Inventory& from) {
  auto& groups = *into->mutable_groups();

  for (const auto& [name, group] : from.groups()) {
    auto& dst = groups[name];
    dst.set_name(name);

    for (const auto& host : group.hosts()) AddUnique(dst.mutable_hosts(), host);
    for (const auto& child : group.children()) AddUnique(dst.mutable_children(), child);

    if (!group.vars().fields().empty()) vars::MergeInto(dst.mutable_vars(), group.vars());
    if (group.priority() != 0) dst.set_priority(group.priority());
  }

  auto& hostvars = *into->mutable_hostvars();
  for (const auto& [host, vars] : from.hostvars()) {
    vars::MergeInto(&hostvars[host], vars);
  }
}

void AssignUngrouped(fleet::v1::Inventory* inventory, const std::string& root_group, const std::string& ungrouped_group) {
  if (ungrouped_group.empty()) return;

  std::unordered_set<std::string> grouped;
  for (const auto& [name, group] : inventory->groups()) {
    if (name == root_group) continue;
    grouped.insert(group.hosts().begin(), group.hosts().end());
  }

  std::vector<std::string> orphans;
  for (const auto& host : CollectHostNames(*inventory)) {
    if (!grouped.count(host)) orphans.push_back(host);
  }
  if (orphans.empty()) return;

  auto& group = (*inventory->mutable_groups())[ungrouped_group];
  group.set_name(ungrouped_group);
  for (const auto& host : orphans) AddUnique(group.mutable_hosts(), host);
}

} // namespace fleet::inventory
