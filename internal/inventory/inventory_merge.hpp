#pragma once

#include <string>

#include "fleet/v1/inventory.pb.h"

namespace fleet::inventory {

/*
  Folds a later source into an earlier one.

  Hosts and children are unions in first-seen order. Group vars and hostvars
  are deep-merged with `from` taking precedence.
*/
void MergeInventory(fleet::v1::Inventory* into, const fleet::v1::Inventory& from);

/*
  Puts every host that belongs to no group except the root group into
  `ungrouped_group`. The group is only created when it gets members.
*/
void AssignUngrouped(fleet::v1::Inventory* inventory, const std::string& root_group, const std::string& ungrouped_group);

} // namespace fleet::inventory
