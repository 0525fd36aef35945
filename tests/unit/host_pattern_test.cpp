#include "internal/inventory/host_pattern.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/inventory/inventory_schema.hpp"
#include "internal/inventory/resolved_inventory.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace {

using fleet::inventory::ResolvedInventory;
using Hosts = std::vector<std::string>;

const ResolvedInventory& Fleet() {
  static const ResolvedInventory inventory(fleet::inventory::ParseInventoryDocument(*fleet::util::ParseJsonObject(R"({
    "all": {},
    "production": {"children": ["webservers", "dbservers"]},
    "staging": ["web3", "db3"],
    "webservers": ["web1", "web2", "web3"],
    "dbservers": ["db1", "db2"],
    "edge": ["cdn-1.example.com"]
  })"),
                                                                                       "test.json"),
                                           "all");
  return inventory;
}

bool Invalid(const std::string& pattern) {
  try {
    (void)Fleet().MatchHosts(pattern);
  } catch (const fleet::util::InvalidPattern&) {
    return true;
  }
  return false;
}

void TestAllAndStar() {
  assert(Fleet().MatchHosts("all").size() == 7);
  assert(Fleet().MatchHosts("*").size() == 7);
  assert(Fleet().MatchHosts("").empty());
}

void TestGroupIncludesDescendants() {
  assert((Fleet().MatchHosts("production") == Hosts{"db1", "db2", "web1", "web2", "web3"}));
  assert((Fleet().MatchHosts("dbservers") == Hosts{"db1", "db2"}));
}

void TestSingleHost() {
  assert((Fleet().MatchHosts("web2") == Hosts{"web2"}));
  assert((Fleet().MatchHosts(" web2 ") == Hosts{"web2"}));
}

void TestUnionIntersectionExclusion() {
  assert((Fleet().MatchHosts("dbservers:edge") == Hosts{"cdn-1.example.com", "db1", "db2"}));
  assert((Fleet().MatchHosts("dbservers,web1") == Hosts{"db1", "db2", "web1"}));
  assert((Fleet().MatchHosts("webservers:&staging") == Hosts{"web3"}));
  assert((Fleet().MatchHosts("production:!staging") == Hosts{"db1", "db2", "web1", "web2"}));
  assert((Fleet().MatchHosts("all:!production:!edge") == Hosts{"db3"}));
}

void TestGlobs() {
  assert((Fleet().MatchHosts("web*") == Hosts{"web1", "web2", "web3"}));
  assert((Fleet().MatchHosts("db[12]") == Hosts{"db1", "db2"}));
  assert((Fleet().MatchHosts("db[!12]") == Hosts{"db3"}));
  assert((Fleet().MatchHosts("web?") == Hosts{"web1", "web2", "web3"}));
  // dots are literal in globs
  assert((Fleet().MatchHosts("cdn-1.example.*") == Hosts{"cdn-1.example.com"}));
  assert(Fleet().MatchHosts("cdn-1xexample*").empty());
}

void TestRegex() {
  assert((Fleet().MatchHosts("~web[13]") == Hosts{"web1", "web3"}));
  assert((Fleet().MatchHosts("~^db") == Hosts{"db1", "db2", "db3"}));
}

void TestGlobToRegex() {
  assert(fleet::inventory::GlobToRegex("web*") == "^web.*$");
  assert(fleet::inventory::GlobToRegex("a.b?") == "^a\\.b.$");
  assert(fleet::inventory::GlobToRegex("db[!0-4]") == "^db[^0-4]$");
}

void TestInvalidPatterns() {
  assert(Invalid("no-such-host"));
  assert(Invalid("~web[("));
  assert(Invalid("webservers:&"));
  assert(Invalid("webservers:!"));
}

} // namespace

int main() {
  TestAllAndStar();
  TestGroupIncludesDescendants();
  TestSingleHost();
  TestUnionIntersectionExclusion();
  TestGlobs();
  TestRegex();
  TestGlobToRegex();
  TestInvalidPatterns();

  std::cout << "fleet_unit_host_pattern: pass\n";
  return 0;
}
