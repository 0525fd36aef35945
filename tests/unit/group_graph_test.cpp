#include "internal/inventory/group_graph.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/inventory/inventory_schema.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace {

using fleet::inventory::GroupGraph;
using fleet::v1::Inventory;

Inventory Parse(const std::string& text) {
  auto parsed = fleet::util::ParseJsonObject(text);
  assert(parsed.has_value());
  return fleet::inventory::ParseInventoryDocument(*parsed, "test.json");
}

std::string CycleOf(const std::string& text, const std::string& root = "all") {
  try {
    GroupGraph graph(Parse(text), root);
  } catch (const fleet::util::InventoryCycleError& e) {
    return e.cycle();
  }
  return "";
}

void TestDepthFollowsDeepestParent() {
  GroupGraph graph(Parse(R"({
    "all": {"children": ["production"]},
    "production": {"children": ["webservers", "dbservers"]},
    "webservers": {"children": ["edge"]},
    "dbservers": {},
    "edge": {},
    "standalone": ["s1"]
  })"),
                   "all");

  assert(graph.Depth("all") == 0);
  assert(graph.Depth("production") == 1);
  assert(graph.Depth("standalone") == 1);
  assert(graph.Depth("webservers") == 2);
  assert(graph.Depth("dbservers") == 2);
  assert(graph.Depth("edge") == 3);
}

void TestDepthWithoutRootGroupStartsAtZero() {
  GroupGraph graph(Parse(R"({"parent": {"children": ["child"]}})"), "all");
  assert(!graph.Contains("all"));
  assert(graph.Depth("parent") == 0);
  assert(graph.Depth("child") == 1);
}

void TestUndeclaredChildrenAreEmptyGroups() {
  GroupGraph graph(Parse(R"({"parent": {"children": ["ghost"]}})"), "all");
  assert(graph.Contains("ghost"));
  assert(graph.Children("ghost").empty());
  assert(graph.Parents("ghost").size() == 1);
}

void TestAncestryOrderedByDepthThenName() {
  // diamond: leaf has two parents of equal depth below one grandparent
  GroupGraph graph(Parse(R"({
    "all": {},
    "top": {"children": ["left", "right"]},
    "right": {"children": ["leaf"]},
    "left": {"children": ["leaf"]},
    "leaf": {},
    "other": {}
  })"),
                   "all");

  const auto ancestry = graph.Ancestry({"leaf"});
  const std::vector<std::string> expected = {"all", "top", "left", "right", "leaf"};
  assert(ancestry == expected);

  // each group appears once even when reachable along two paths
  const auto twice = graph.Ancestry({"leaf", "left"});
  assert(twice == expected);
}

void TestPriorityOrdersGroupsOfEqualDepth() {
  GroupGraph graph(Parse(R"({
    "all": {"children": ["a", "b", "c"]},
    "a": {"priority": 10},
    "b": {},
    "c": {"priority": -1}
  })"),
                   "all");

  assert(graph.Priority("a") == 10);
  assert(graph.Priority("b") == 0);
  assert(graph.Priority("missing") == 0);

  const std::vector<std::string> expected = {"all", "c", "b", "a"};
  assert(graph.Ancestry({"a", "b", "c"}) == expected);
}

void TestDescendants() {
  GroupGraph graph(Parse(R"({"a": {"children": ["b", "c"]}, "b": {"children": ["d"]}, "c": {"children": ["d"]}})"), "all");

  auto below = graph.Descendants("a");
  assert(below.size() == 4);
  assert(below.front() == "a");
  assert(graph.Descendants("d").size() == 1);
}

void TestCycleIsReportedWithItsPath() {
  const auto cycle = CycleOf(R"({"A": {"children": ["B"]}, "B": {"children": ["A"]}})");
  assert(cycle == "A -> B -> A");

  const auto longer = CycleOf(R"({"a": {"children": ["b"]}, "b": {"children": ["c"]}, "c": {"children": ["a"]}})");
  assert(longer == "a -> b -> c -> a");

  assert(CycleOf(R"({"self": {"children": ["self"]}})") == "self -> self");
}

void TestEdgeIntoRootIsACycle() {
  const auto cycle = CycleOf(R"({"all": {"children": ["web"]}, "web": {"children": ["all"]}})");
  assert(!cycle.empty());

  const auto only_into_root = CycleOf(R"({"all": {}, "web": {"children": ["all"]}})");
  assert(only_into_root == "all -> web -> all");
}

void TestAcyclicSharedChildIsNotACycle() {
  assert(CycleOf(R"({"a": {"children": ["c"]}, "b": {"children": ["c"]}, "c": {}})").empty());
}

} // namespace

int main() {
  TestDepthFollowsDeepestParent();
  TestDepthWithoutRootGroupStartsAtZero();
  TestUndeclaredChildrenAreEmptyGroups();
  TestAncestryOrderedByDepthThenName();
  TestPriorityOrdersGroupsOfEqualDepth();
  TestDescendants();
  TestCycleIsReportedWithItsPath();
  TestEdgeIntoRootIsACycle();
  TestAcyclicSharedChildIsNotACycle();

  std::cout << "fleet_unit_group_graph: pass\n";
  return 0;
}
