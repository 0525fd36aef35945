#pragma once

#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "fleet/v1/inventory.pb.h"

namespace fleet::inventory {

/*
  The --list document shape, shared by static files and dynamic sources:

    {
      "<group>": {"hosts": [..], "children": [..], "vars": {..}, "priority": n},
      "<group>": ["host", ..],
      "_meta": {"hostvars": {"<host>": {..}}}
    }

  The native YAML layout is accepted as well: "hosts" as a mapping of host
  name to its vars, "children" as a mapping of child name to a nested group
  definition.

  Parse failures raise util::InventorySourceError naming `origin`.
*/
fleet::v1::Inventory ParseInventoryDocument(const google::protobuf::Struct& document, const std::string& origin);

bool HasMeta(const google::protobuf::Struct& document);

google::protobuf::Struct ToInventoryDocument(const fleet::v1::Inventory& inventory);

// Group members plus hostvars keys, sorted.
std::vector<std::string> CollectHostNames(const fleet::v1::Inventory& inventory);

// Adds value to a repeated field unless already present (first-seen order).
void AddUnique(google::protobuf::RepeatedPtrField<std::string>* values, const std::string& value);

} // namespace fleet::inventory
