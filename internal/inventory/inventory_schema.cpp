#include "inventory_schema.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <set>

#include "internal/util/errors.hpp"
#include "internal/vars/merge.hpp"

namespace fleet::inventory {

using fleet::v1::Group;
using fleet::v1::Inventory;
using google::protobuf::Struct;
using google::protobuf::Value;

namespace {

constexpr char kMeta[]     = "_meta";
constexpr char kHostvars[] = "hostvars";
constexpr char kHosts[]    = "hosts";
constexpr char kChildren[] = "children";
constexpr char kVars[]     = "vars";
constexpr char kPriority[] = "priority";

void ReadNameList(const Value& value, const std::string& origin, const std::string& what,
                  google::protobuf::RepeatedPtrField<std::string>* out) {
  if (value.has_null_value()) return;
  if (!value.has_list_value()) {
    throw util::InventorySourceError(origin, what + ": expected a list of names");
  }
  for (const auto& item : value.list_value().values()) {
    if (!item.has_string_value()) {
      throw util::InventorySourceError(origin, what + ": names must be strings");
    }
    AddUnique(out, item.string_value());
  }
}

void ReadHostMap(const Struct& hosts, const std::string& origin, const std::string& what, Group* group, Inventory* inventory) {
  for (const auto& [host, host_vars] : hosts.fields()) {
    AddUnique(group->mutable_hosts(), host);
    if (host_vars.has_null_value()) continue;
    if (!host_vars.has_struct_value()) {
      throw util::InventorySourceError(origin, what + "." + host + ": expected a mapping of vars");
    }
    if (!host_vars.struct_value().fields().empty()) {
      vars::MergeInto(&(*inventory->mutable_hostvars())[host], host_vars.struct_value());
    }
  }
}

int ReadPriority(const Value& value, const std::string& origin, const std::string& what) {
  const double number = value.number_value();
  if (!value.has_number_value() || number != std::floor(number) || std::fabs(number) > std::numeric_limits<int32_t>::max()) {
    throw util::InventorySourceError(origin, what + ": expected an integer");
  }
  return static_cast<int>(number);
}

/*
  Folds one group definition into `inventory`. A group may be defined more
  than once (nested under several parents); definitions accumulate.

  Besides the --list forms, `hosts` may map host names to their vars and
  `children` may map child names to nested group definitions.
*/
void ParseGroup(const std::string& name, const Value& value, const std::string& origin, Inventory* inventory) {
  const auto where = "group " + name;
  {
    auto& group = (*inventory->mutable_groups())[name];
    group.set_name(name);

    if (value.has_null_value()) return;

    // bare list form: "group": ["host1", "host2"]
    if (value.has_list_value()) {
      ReadNameList(value, origin, where, group.mutable_hosts());
      return;
    }

    if (!value.has_struct_value()) {
      throw util::InventorySourceError(origin, where + ": expected an object or a list of hosts");
    }

    const auto& fields = value.struct_value().fields();
    if (auto it = fields.find(kHosts); it != fields.end()) {
      if (it->second.has_struct_value()) {
        ReadHostMap(it->second.struct_value(), origin, where + " hosts", &group, inventory);
      } else {
        ReadNameList(it->second, origin, where + " hosts", group.mutable_hosts());
      }
    }
    if (auto it = fields.find(kVars); it != fields.end() && !it->second.has_null_value()) {
      if (!it->second.has_struct_value()) {
        throw util::InventorySourceError(origin, where + " vars: expected a mapping");
      }
      if (!it->second.struct_value().fields().empty()) vars::MergeInto(group.mutable_vars(), it->second.struct_value());
    }
    if (auto it = fields.find(kPriority); it != fields.end() && !it->second.has_null_value()) {
      group.set_priority(ReadPriority(it->second, origin, where + " priority"));
    }

    auto children = fields.find(kChildren);
    if (children == fields.end() || !children->second.has_struct_value()) {
      if (children != fields.end()) ReadNameList(children->second, origin, where + " children", group.mutable_children());
      return;
    }
  }

  // nested definitions insert into the groups map, so `group` is looked up again per child
  for (const auto& [child, body] : value.struct_value().fields().at(kChildren).struct_value().fields()) {
    AddUnique((*inventory->mutable_groups())[name].mutable_children(), child);
    ParseGroup(child, body, origin, inventory);
  }
}

Value NameList(const google::protobuf::RepeatedPtrField<std::string>& names) {
  Value value;
  auto* list = value.mutable_list_value();
  for (const auto& name : names) list->add_values()->set_string_value(name);
  return value;
}

} // namespace

void AddUnique(google::protobuf::RepeatedPtrField<std::string>* values, const std::string& value) {
  if (std::find(values->begin(), values->end(), value) == values->end()) {
    *values->Add() = value;
  }
}

bool HasMeta(const Struct& document) {
  return document.fields().count(kMeta) > 0;
}

Inventory ParseInventoryDocument(const Struct& document, const std::string& origin) {
  Inventory inventory;

  for (const auto& [key, value] : document.fields()) {
    if (key == kMeta) continue;
    ParseGroup(key, value, origin, &inventory);
  }

  auto meta = document.fields().find(kMeta);
  if (meta == document.fields().end() || meta->second.has_null_value()) return inventory;
  if (!meta->second.has_struct_value()) {
    throw util::InventorySourceError(origin, "_meta: expected a mapping");
  }

  const auto& meta_fields = meta->second.struct_value().fields();
  auto        hostvars    = meta_fields.find(kHostvars);
  if (hostvars == meta_fields.end() || hostvars->second.has_null_value()) return inventory;
  if (!hostvars->second.has_struct_value()) {
    throw util::InventorySourceError(origin, "_meta.hostvars: expected a mapping");
  }

  for (const auto& [host, vars] : hostvars->second.struct_value().fields()) {
    if (vars.has_null_value()) {
      (*inventory.mutable_hostvars())[host];
      continue;
    }
    if (!vars.has_struct_value()) {
      throw util::InventorySourceError(origin, "_meta.hostvars." + host + ": expected a mapping");
    }
    vars::MergeInto(&(*inventory.mutable_hostvars())[host], vars.struct_value());
  }

  return inventory;
}

Struct ToInventoryDocument(const Inventory& inventory) {
  Struct document;
  auto&  fields = *document.mutable_fields();

  for (const auto& [name, group] : inventory.groups()) {
    Struct body;
    if (!group.hosts().empty()) (*body.mutable_fields())[kHosts] = NameList(group.hosts());
    if (!group.children().empty()) (*body.mutable_fields())[kChildren] = NameList(group.children());
    if (!group.vars().fields().empty()) *(*body.mutable_fields())[kVars].mutable_struct_value() = group.vars();
    if (group.priority() != 0) (*body.mutable_fields())[kPriority].set_number_value(group.priority());
    *fields[name].mutable_struct_value() = std::move(body);
  }

  auto* meta     = fields[kMeta].mutable_struct_value();
  auto* hostvars = (*meta->mutable_fields())[kHostvars].mutable_struct_value();
  for (const auto& [host, vars] : inventory.hostvars()) {
    *(*hostvars->mutable_fields())[host].mutable_struct_value() = vars;
  }

  return document;
}

std::vector<std::string> CollectHostNames(const Inventory& inventory) {
  std::set<std::string> names;
  for (const auto& [_, group] : inventory.groups()) {
    names.insert(group.hosts().begin(), group.hosts().end());
  }
  for (const auto& [host, _] : inventory.hostvars()) names.insert(host);
  return {names.begin(), names.end()};
}

} // namespace fleet::inventory
