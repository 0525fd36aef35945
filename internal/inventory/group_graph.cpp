#include "group_graph.hpp"

#include <algorithm>
#include <queue>
#include <unordered_set>

#include "internal/util/errors.hpp"

namespace fleet::inventory {

namespace {

const std::vector<std::string> kNone;

enum class Mark { kNew, kOnPath, kDone };

} // namespace

GroupGraph::GroupGraph(const fleet::v1::Inventory& inventory, std::string root_group) : root_group_(std::move(root_group)) {
  for (const auto& [name, group] : inventory.groups()) {
    auto& children = children_[name];
    parents_[name];
    if (group.priority() != 0) priority_[name] = group.priority();
    for (const auto& child : group.children()) {
      children.push_back(child);
      parents_[child].push_back(name);
      children_[child];
    }
  }

  for (auto& [_, parents] : parents_) std::sort(parents.begin(), parents.end());

  has_root_ = children_.count(root_group_) > 0;

  CheckAcyclic();

  std::unordered_map<std::string, int> memo;
  for (const auto& [name, _] : children_) depth_[name] = ComputeDepth(name, &memo);
}

// ------------------------------------------------------------
// Validation
// ------------------------------------------------------------

void GroupGraph::CheckAcyclic() const {
  // the root is above every group, so any edge into it closes a cycle
  if (has_root_) {
    const auto& into_root = Parents(root_group_);
    if (!into_root.empty()) {
      throw util::InventoryCycleError(root_group_ + " -> " + into_root.front() + " -> " + root_group_);
    }
  }

  std::unordered_map<std::string, Mark> marks;
  std::vector<std::string>              path;

  // iterative DFS; the explicit stack keeps deep hierarchies off the call stack
  struct Frame {
    std::string name;
    size_t      next_child;
  };

  for (const auto& start : Names()) {
    if (marks[start] != Mark::kNew) continue;

    std::vector<Frame> stack;
    stack.push_back({start, 0});
    marks[start] = Mark::kOnPath;
    path.push_back(start);

    while (!stack.empty()) {
      auto&       frame    = stack.back();
      const auto& children = Children(frame.name);

      if (frame.next_child == children.size()) {
        marks[frame.name] = Mark::kDone;
        path.pop_back();
        stack.pop_back();
        continue;
      }

      const std::string child = children[frame.next_child++];
      const Mark        mark  = marks[child];

      if (mark == Mark::kOnPath) {
        auto        begin = std::find(path.begin(), path.end(), child);
        std::string cycle;
        for (auto it = begin; it != path.end(); ++it) cycle += *it + " -> ";
        throw util::InventoryCycleError(cycle + child);
      }
      if (mark == Mark::kDone) continue;

      marks[child] = Mark::kOnPath;
      path.push_back(child);
      stack.push_back({child, 0});
    }
  }
}

int GroupGraph::ComputeDepth(const std::string& group, std::unordered_map<std::string, int>* memo) const {
  if (auto it = memo->find(group); it != memo->end()) return it->second;

  int depth = 0;
  if (group != root_group_) {
    const auto& parents = Parents(group);
    if (parents.empty()) {
      depth = has_root_ ? 1 : 0;
    } else {
      for (const auto& parent : parents) depth = std::max(depth, ComputeDepth(parent, memo) + 1);
    }
  }

  (*memo)[group] = depth;
  return depth;
}

// ------------------------------------------------------------
// Queries
// ------------------------------------------------------------

bool GroupGraph::Contains(const std::string& group) const {
  return children_.count(group) > 0;
}

int GroupGraph::Depth(const std::string& group) const {
  auto it = depth_.find(group);
  return it == depth_.end() ? 0 : it->second;
}

int GroupGraph::Priority(const std::string& group) const {
  auto it = priority_.find(group);
  return it == priority_.end() ? 0 : it->second;
}

const std::vector<std::string>& GroupGraph::Parents(const std::string& group) const {
  auto it = parents_.find(group);
  return it == parents_.end() ? kNone : it->second;
}

const std::vector<std::string>& GroupGraph::Children(const std::string& group) const {
  auto it = children_.find(group);
  return it == children_.end() ? kNone : it->second;
}

std::vector<std::string> GroupGraph::Ancestry(const std::vector<std::string>& direct_groups) const {
  std::queue<std::string>         q;
  std::unordered_set<std::string> visited;

  for (const auto& group : direct_groups) {
    if (visited.insert(group).second) q.push(group);
  }
  if (has_root_) visited.insert(root_group_);

  while (!q.empty()) {
    auto node = q.front();
    q.pop();

    for (const auto& parent : Parents(node)) {
      if (!visited.insert(parent).second) continue;
      q.push(parent);
    }
  }

  std::vector<std::string> ordered(visited.begin(), visited.end());
  std::sort(ordered.begin(), ordered.end(), [this](const std::string& a, const std::string& b) {
    const int da = Depth(a);
    const int db = Depth(b);
    if (da != db) return da < db;
    const int pa = Priority(a);
    const int pb = Priority(b);
    if (pa != pb) return pa < pb;
    return a < b;
  });
  return ordered;
}

std::vector<std::string> GroupGraph::Descendants(const std::string& group) const {
  std::vector<std::string>        result;
  std::queue<std::string>         q;
  std::unordered_set<std::string> visited;

  q.push(group);
  visited.insert(group);

  while (!q.empty()) {
    auto node = q.front();
    q.pop();
    result.push_back(node);

    for (const auto& child : Children(node)) {
      if (!visited.insert(child).second) continue;
      q.push(child);
    }
  }

  return result;
}

std::vector<std::string> GroupGraph::Names() const {
  std::vector<std::string> names;
  names.reserve(children_.size());
  for (const auto& [name, _] : children_) names.push_back(name);
  std::sort(names.begin(), names.end());
  return names;
}

} // namespace fleet::inventory
