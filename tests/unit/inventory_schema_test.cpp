#include "internal/inventory/inventory_schema.hpp"

#include <google/protobuf/util/message_differencer.h>

#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>

#include "internal/inventory/inventory_merge.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace {

using fleet::inventory::ParseInventoryDocument;
using fleet::inventory::ToInventoryDocument;
using fleet::v1::Inventory;
using google::protobuf::Struct;
using google::protobuf::util::MessageDifferencer;

Struct Json(const std::string& text) {
  auto parsed = fleet::util::ParseJsonObject(text);
  assert(parsed.has_value());
  return *parsed;
}

bool ParseFails(const std::string& text) {
  try {
    (void)ParseInventoryDocument(Json(text), "test.json");
  } catch (const fleet::util::InventorySourceError& e) {
    return e.source() == "test.json";
  }
  return false;
}

void TestObjectAndListGroupForms() {
  const auto inventory = ParseInventoryDocument(Json(R"({
    "web": {"hosts": ["w1", "w2", "w1"], "children": ["edge"], "vars": {"port": 80}},
    "edge": ["e1"],
    "empty": {},
    "nothing": null
  })"),
                                                "test.json");

  assert(inventory.groups_size() == 4);

  const auto& web = inventory.groups().at("web");
  assert(web.name() == "web");
  assert(web.hosts_size() == 2);
  assert(web.hosts(0) == "w1" && web.hosts(1) == "w2");
  assert(web.children_size() == 1 && web.children(0) == "edge");
  assert(web.vars().fields().at("port").number_value() == 80);

  assert(inventory.groups().at("edge").hosts(0) == "e1");
  assert(inventory.groups().at("empty").hosts_size() == 0);
  assert(inventory.groups().count("nothing") == 1);
}

void TestMetaHostvarsAreRead() {
  const auto document  = Json(R"({"web": ["w1"], "_meta": {"hostvars": {"w1": {"ip": "10.0.0.1"}, "w9": {}}}})");
  const auto inventory = ParseInventoryDocument(document, "test.json");

  assert(fleet::inventory::HasMeta(document));
  assert(inventory.groups().count("_meta") == 0);
  assert(inventory.hostvars().at("w1").fields().at("ip").string_value() == "10.0.0.1");
  assert(inventory.hostvars().count("w9") == 1);

  const auto hosts = fleet::inventory::CollectHostNames(inventory);
  assert(hosts.size() == 2);
  assert(hosts[0] == "w1" && hosts[1] == "w9");

  assert(!fleet::inventory::HasMeta(Json(R"({"web": ["w1"]})")));
}

bool HasName(const google::protobuf::RepeatedPtrField<std::string>& names, const std::string& name) {
  return std::find(names.begin(), names.end(), name) != names.end();
}

void TestNativeMappingForms() {
  const auto inventory = ParseInventoryDocument(Json(R"({
    "all": {
      "hosts": {"solo": null},
      "children": {
        "web": {"hosts": {"w1": {"port": 80}, "w2": null}, "children": {"edge": {"hosts": ["e1"]}}},
        "db": null
      }
    },
    "edge": {"vars": {"cdn": true}, "priority": 3},
    "_meta": {"hostvars": {"w1": {"ip": "10.0.0.1"}}}
  })"),
                                                "test.yml");

  assert(inventory.groups_size() == 4);

  const auto& all = inventory.groups().at("all");
  assert(all.hosts_size() == 1 && all.hosts(0) == "solo");
  assert(all.children_size() == 2);
  assert(HasName(all.children(), "web") && HasName(all.children(), "db"));

  const auto& web = inventory.groups().at("web");
  assert(web.hosts_size() == 2);
  assert(HasName(web.hosts(), "w1") && HasName(web.hosts(), "w2"));
  assert(web.children_size() == 1 && web.children(0) == "edge");

  // nested and top-level definitions of one group accumulate
  const auto& edge = inventory.groups().at("edge");
  assert(edge.hosts_size() == 1 && edge.hosts(0) == "e1");
  assert(edge.vars().fields().at("cdn").bool_value());
  assert(edge.priority() == 3);

  // vars under a host entry land in hostvars, _meta adds to them
  const auto& w1 = inventory.hostvars().at("w1");
  assert(w1.fields().at("port").number_value() == 80);
  assert(w1.fields().at("ip").string_value() == "10.0.0.1");
  assert(inventory.hostvars().count("w2") == 0);
  assert(inventory.hostvars().count("solo") == 0);
}

void TestMalformedDocumentsNameTheSource() {
  assert(ParseFails(R"({"web": "w1"})"));
  assert(ParseFails(R"({"web": {"hosts": "w1"}})"));
  assert(ParseFails(R"({"web": {"hosts": [1, 2]}})"));
  assert(ParseFails(R"({"web": {"children": [{"a": 1}]}})"));
  assert(ParseFails(R"({"web": {"vars": ["a"]}})"));
  assert(ParseFails(R"({"_meta": []})"));
  assert(ParseFails(R"({"_meta": {"hostvars": {"w1": "x"}}})"));
  assert(ParseFails(R"({"web": {"hosts": {"w1": 1}}})"));
  assert(ParseFails(R"({"web": {"children": {"edge": "e1"}}})"));
  assert(ParseFails(R"({"web": {"priority": 1.5}})"));
  assert(ParseFails(R"({"web": {"priority": "high"}})"));
}

void TestDocumentRoundTrip() {
  const auto original = ParseInventoryDocument(Json(R"({
    "all": {"children": ["web", "db"], "vars": {"ntp": {"server": "a"}}},
    "web": {"hosts": ["w1", "w2"], "vars": {"port": 80, "tags": ["x", "y"]}, "priority": 2},
    "db": {"hosts": ["d1"]},
    "_meta": {"hostvars": {"w1": {"ip": "10.0.0.1"}, "d1": {"primary": true}}}
  })"),
                                               "test.json");

  const auto document = ToInventoryDocument(original);
  assert(fleet::inventory::HasMeta(document));

  const auto reparsed = ParseInventoryDocument(document, "roundtrip");
  assert(MessageDifferencer::Equals(original, reparsed));
}

void TestMergeInventoryLaterSourceWins() {
  auto first = ParseInventoryDocument(Json(R"({
    "web": {"hosts": ["w1"], "vars": {"port": 80, "tls": {"enabled": false, "cert": "a.pem"}}},
    "_meta": {"hostvars": {"w1": {"ip": "10.0.0.1", "rack": 1}}}
  })"),
                                      "first");
  const auto second = ParseInventoryDocument(Json(R"({
    "web": {"hosts": ["w2", "w1"], "children": ["edge"], "vars": {"port": 81, "tls": {"enabled": true}}},
    "db": ["d1"],
    "_meta": {"hostvars": {"w1": {"rack": 2}}}
  })"),
                                             "second");

  fleet::inventory::MergeInventory(&first, second);

  const auto& web = first.groups().at("web");
  assert(web.hosts_size() == 2);
  assert(web.hosts(0) == "w1" && web.hosts(1) == "w2");
  assert(web.children_size() == 1);

  const auto& vars = web.vars().fields();
  assert(vars.at("port").number_value() == 81);
  assert(vars.at("tls").struct_value().fields().at("enabled").bool_value());
  assert(vars.at("tls").struct_value().fields().at("cert").string_value() == "a.pem");

  assert(first.groups().count("db") == 1);

  const auto& w1 = first.hostvars().at("w1").fields();
  assert(w1.at("ip").string_value() == "10.0.0.1");
  assert(w1.at("rack").number_value() == 2);
}

void TestAssignUngrouped() {
  auto inventory = ParseInventoryDocument(Json(R"({
    "all": {"hosts": ["a1"], "vars": {"x": 1}},
    "web": ["w1"],
    "_meta": {"hostvars": {"lonely": {"y": 2}, "w1": {}}}
  })"),
                                          "test.json");

  fleet::inventory::AssignUngrouped(&inventory, "all", "ungrouped");

  const auto& ungrouped = inventory.groups().at("ungrouped");
  assert(ungrouped.hosts_size() == 2);
  assert(ungrouped.hosts(0) == "a1" && ungrouped.hosts(1) == "lonely");

  // nothing to place: no group is created
  auto grouped = ParseInventoryDocument(Json(R"({"web": ["w1"]})"), "test.json");
  fleet::inventory::AssignUngrouped(&grouped, "all", "ungrouped");
  assert(grouped.groups().count("ungrouped") == 0);
}

} // namespace

int main() {
  TestObjectAndListGroupForms();
  TestMetaHostvarsAreRead();
  TestNativeMappingForms();
  TestMalformedDocumentsNameTheSource();
  TestDocumentRoundTrip();
  TestMergeInventoryLaterSourceWins();
  TestAssignUngrouped();

  std::cout << "fleet_unit_inventory_schema: pass\n";
  return 0;
}
