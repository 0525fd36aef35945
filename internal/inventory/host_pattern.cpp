#include "host_pattern.hpp"

#include <regex>
#include <set>

#include "internal/inventory/resolved_inventory.hpp"
#include "internal/util/errors.hpp"

namespace fleet::inventory {

namespace {

std::string_view Trim(std::string_view text) {
  const auto first = text.find_first_not_of(" \t");
  if (first == std::string_view::npos) return {};
  const auto last = text.find_last_not_of(" \t");
  return text.substr(first, last - first + 1);
}

// splits on ':' and ',' outside of [...] classes
std::vector<std::string_view> SplitPattern(std::string_view pattern) {
  std::vector<std::string_view> parts;
  int    depth = 0;
  size_t start = 0;
  for (size_t i = 0; i < pattern.size(); ++i) {
    const char c = pattern[i];
    if (c == '[') ++depth;
    if (c == ']' && depth > 0) --depth;
    if ((c == ':' || c == ',') && depth == 0) {
      parts.push_back(pattern.substr(start, i - start));
      start = i + 1;
    }
  }
  parts.push_back(pattern.substr(start));
  return parts;
}

bool HasGlob(std::string_view pattern) {
  return pattern.find_first_of("*?[") != std::string_view::npos;
}

std::vector<std::string> MatchRegex(const ResolvedInventory& inventory, const std::string& expression, std::string_view pattern) {
  std::regex regex;
  try {
    regex = std::regex(expression, std::regex::ECMAScript);
  } catch (const std::regex_error& e) {
    throw util::InvalidPattern(std::string(pattern) + ": " + e.what());
  }

  std::vector<std::string> matched;
  for (const auto& host : inventory.Hosts()) {
    if (std::regex_search(host, regex)) matched.push_back(host);
  }
  return matched;
}

std::vector<std::string> MatchSimple(const ResolvedInventory& inventory, std::string_view pattern) {
  if (pattern.empty()) throw util::InvalidPattern("empty pattern component");
  if (pattern == "all" || pattern == "*") return inventory.Hosts();

  if (pattern.front() == '~') {
    return MatchRegex(inventory, std::string(pattern.substr(1)), pattern);
  }

  if (HasGlob(pattern)) {
    return MatchRegex(inventory, GlobToRegex(pattern), pattern);
  }

  const std::string name(pattern);
  if (inventory.HasGroup(name)) return inventory.HostsInGroup(name);
  if (inventory.HasHost(name)) return {name};

  throw util::InvalidPattern("no hosts matched pattern: " + name);
}

} // namespace

std::string GlobToRegex(std::string_view glob) {
  std::string out = "^";
  for (size_t i = 0; i < glob.size(); ++i) {
    const char c = glob[i];
    switch (c) {
      case '*':
        out += ".*";
        break;
      case '?':
        out += '.';
        break;
      case '[': {
        auto close = glob.find(']', i + 1);
        if (close == std::string_view::npos) {
          out += "\\[";
          break;
        }
        std::string_view body = glob.substr(i + 1, close - i - 1);
        out += '[';
        if (!body.empty() && body.front() == '!') {
          out += '^';
          body.remove_prefix(1);
        }
        out.append(body.begin(), body.end());
        out += ']';
        i = close;
        break;
      }
      case '.':
      case '+':
      case '(':
      case ')':
      case '{':
      case '}':
      case '^':
      case '$':
      case '|':
      case '\\':
        out += '\\';
        out += c;
        break;
      default:
        out += c;
    }
  }
  out += '$';
  return out;
}

std::vector<std::string> MatchHosts(const ResolvedInventory& inventory, std::string_view pattern) {
  pattern = Trim(pattern);
  if (pattern.empty()) return {};

  // a bare regex may legitimately contain ':' or ','
  if (pattern.front() == '~') return MatchSimple(inventory, pattern);

  std::set<std::string> result;
  for (auto part : SplitPattern(pattern)) {
    part = Trim(part);
    if (part.empty()) continue;

    if (part.front() == '&') {
      const auto subset = MatchSimple(inventory, Trim(part.substr(1)));
      std::set<std::string> kept;
      for (const auto& host : subset) {
        if (result.count(host)) kept.insert(host);
      }
      result = std::move(kept);
    } else if (part.front() == '!') {
      for (const auto& host : MatchSimple(inventory, Trim(part.substr(1)))) result.erase(host);
    } else {
      for (auto& host : MatchSimple(inventory, part)) result.insert(std::move(host));
    }
  }

  return {result.begin(), result.end()};
}

} // namespace fleet::inventory
