#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "fleet/v1/inventory.pb.h"

namespace fleet::inventory {

/*
  Parent/child index over the groups of one Inventory.

  The root group (normally "all") is the implicit ancestor of every group:
  it has depth 0, groups without parents have depth 1, and every other group
  is one deeper than its deepest parent. Children that are referenced but
  never declared are treated as empty groups.

  Construction validates the graph and throws util::InventoryCycleError when
  following children edges revisits a group on the current path.
*/
class GroupGraph {
 public:
  GroupGraph(const fleet::v1::Inventory& inventory, std::string root_group);

  bool Contains(const std::string& group) const;

  int Depth(const std::string& group) const;

  // 0 for groups that never set one.
  int Priority(const std::string& group) const;

  const std::vector<std::string>& Parents(const std::string& group) const;
  const std::vector<std::string>& Children(const std::string& group) const;

  /*
    Every group from which a member of `direct_groups` is reachable along
    children edges (the direct groups included), plus the root group.
    Ordered by ascending depth, then ascending priority, then name: the
    merge order for host vars.
  */
  std::vector<std::string> Ancestry(const std::vector<std::string>& direct_groups) const;

  // The group and everything below it.
  std::vector<std::string> Descendants(const std::string& group) const;

  // All group names, sorted.
  std::vector<std::string> Names() const;

  const std::string& root_group() const {
    return root_group_;
  }

 private:
  void CheckAcyclic() const;
  int  ComputeDepth(const std::string& group, std::unordered_map<std::string, int>* memo) const;

  std::string root_group_;
  bool        has_root_ = false;

  std::unordered_map<std::string, std::vector<std::string>> children_;
  std::unordered_map<std::string, std::vector<std::string>> parents_;
  std::unordered_map<std::string, int>                      depth_;
  std::unordered_map<std::string, int>                      priority_;
};

} // namespace fleet::inventory
