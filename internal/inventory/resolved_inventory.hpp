#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "fleet/v1/inventory.pb.h"
#include "internal/inventory/group_graph.hpp"

namespace fleet::inventory {

/*
  ResolvedInventory

  Immutable result of one resolution pass. Host variables are computed on
  first request and cached; each host has its own cache slot created at
  construction, so concurrent HostVars() calls for different hosts never
  contend. A new pass produces a new ResolvedInventory, which is how cached
  variables are invalidated.
*/
class ResolvedInventory {
 public:
  // Throws util::InventoryCycleError.
  ResolvedInventory(fleet::v1::Inventory inventory, std::string root_group);

  ResolvedInventory(const ResolvedInventory&)            = delete;
  ResolvedInventory& operator=(const ResolvedInventory&) = delete;

  const fleet::v1::Inventory& inventory() const {
    return inventory_;
  }
  const GroupGraph& graph() const {
    return graph_;
  }

  // sorted
  const std::vector<std::string>& Hosts() const {
    return hosts_;
  }
  std::vector<std::string> Groups() const;

  bool HasHost(const std::string& host) const;
  bool HasGroup(const std::string& group) const;

  // Groups whose vars apply to the host, lowest precedence first.
  // Throws util::NotFound for an unknown host.
  std::vector<std::string> GroupsOf(const std::string& host) const;

  // Final variable mapping for the host. Throws util::NotFound.
  google::protobuf::Struct HostVars(const std::string& host) const;

  // Hosts of the group and of every group below it, sorted.
  std::vector<std::string> HostsInGroup(const std::string& group) const;

  // See host_pattern.hpp. Throws util::InvalidPattern.
  std::vector<std::string> MatchHosts(std::string_view pattern) const;

  // --list shape, with hostvars fully resolved per host.
  google::protobuf::Struct ToListDocument() const;

 private:
  struct HostEntry {
    std::vector<std::string> direct_groups;

    mutable std::once_flag           once;
    mutable google::protobuf::Struct vars;
  };

  const HostEntry&         Entry(const std::string& host) const;
  google::protobuf::Struct ComputeHostVars(const std::string& host, const HostEntry& entry) const;

  fleet::v1::Inventory     inventory_;
  GroupGraph               graph_;
  std::vector<std::string> hosts_;

  // keys fixed at construction; values synchronize themselves
  std::unordered_map<std::string, std::unique_ptr<HostEntry>> entries_;
};

} // namespace fleet::inventory
