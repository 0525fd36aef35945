#include "resolved_inventory.hpp"

#include <algorithm>
#include <set>

#include "internal/inventory/host_pattern.hpp"
#include "internal/inventory/inventory_schema.hpp"
#include "internal/util/errors.hpp"
#include "internal/vars/merge.hpp"

namespace fleet::inventory {

ResolvedInventory::ResolvedInventory(fleet::v1::Inventory inventory, std::string root_group)
    : inventory_(std::move(inventory)), graph_(inventory_, std::move(root_group)), hosts_(CollectHostNames(inventory_)) {
  for (const auto& host : hosts_) {
    entries_.emplace(host, std::make_unique<HostEntry>());
  }

  for (const auto& [name, group] : inventory_.groups()) {
    for (const auto& host : group.hosts()) {
      entries_.at(host)->direct_groups.push_back(name);
    }
  }
}

std::vector<std::string> ResolvedInventory::Groups() const {
  return graph_.Names();
}

bool ResolvedInventory::HasHost(const std::string& host) const {
  return entries_.count(host) > 0;
}

bool ResolvedInventory::HasGroup(const std::string& group) const {
  return graph_.Contains(group);
}

const ResolvedInventory::HostEntry& ResolvedInventory::Entry(const std::string& host) const {
  auto it = entries_.find(host);
  if (it == entries_.end()) {
    throw util::NotFound("unknown host: " + host);
  }
  return *it->second;
}

std::vector<std::string> ResolvedInventory::GroupsOf(const std::string& host) const {
  return graph_.Ancestry(Entry(host).direct_groups);
}

// ------------------------------------------------------------
// Host variables
// ------------------------------------------------------------

google::protobuf::Struct ResolvedInventory::ComputeHostVars(const std::string& host, const HostEntry& entry) const {
  google::protobuf::Struct vars;

  for (const auto& name : graph_.Ancestry(entry.direct_groups)) {
    auto group = inventory_.groups().find(name);
    if (group == inventory_.groups().end()) continue;
    vars::MergeInto(&vars, group->second.vars());
  }

  // host-level variables always win
  auto own = inventory_.hostvars().find(host);
  if (own != inventory_.hostvars().end()) vars::MergeInto(&vars, own->second);

  return vars;
}

google::protobuf::Struct ResolvedInventory::HostVars(const std::string& host) const {
  const auto& entry = Entry(host);
  std::call_once(entry.once, [&] { entry.vars = ComputeHostVars(host, entry); });
  return entry.vars;
}

// ------------------------------------------------------------
// Membership
// ------------------------------------------------------------

std::vector<std::string> ResolvedInventory::HostsInGroup(const std::string& group) const {
  if (!graph_.Contains(group)) return {};

  // the root group spans the whole inventory even without explicit members
  if (group == graph_.root_group()) return hosts_;

  std::set<std::string> hosts;
  for (const auto& name : graph_.Descendants(group)) {
    auto it = inventory_.groups().find(name);
    if (it == inventory_.groups().end()) continue;
    hosts.insert(it->second.hosts().begin(), it->second.hosts().end());
  }
  return {hosts.begin(), hosts.end()};
}

std::vector<std::string> ResolvedInventory::MatchHosts(std::string_view pattern) const {
  return inventory::MatchHosts(*this, pattern);
}

google::protobuf::Struct ResolvedInventory::ToListDocument() const {
  auto document = ToInventoryDocument(inventory_);

  auto* hostvars = (*(*document.mutable_fields())["_meta"].mutable_struct_value()->mutable_fields())["hostvars"].mutable_struct_value();
  hostvars->clear_fields();
  for (const auto& host : hosts_) {
    *(*hostvars->mutable_fields())[host].mutable_struct_value() = HostVars(host);
  }

  return document;
}

} // namespace fleet::inventory
