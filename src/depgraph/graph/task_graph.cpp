#include "depgraph/graph/task_graph.hpp"

#include "depgraph/util/log.hpp"

#include <ranges>

namespace depgraph {

TaskGraph::TaskGraph(const TaskCollection& collection) {
  nodes_.reserve(collection.tasks.size());
  keys_.reserve(collection.tasks.size());

  for (const auto& task : collection.tasks) {
    if (key_to_idx_.contains(task.id)) [[unlikely]] {
      log::warn("Duplicate task id '{}' ignored in dependency graph", task.id);
      continue;
    }
    auto idx = static_cast<NodeIndex>(nodes_.size());
    nodes_.push_back(Node{.task = &task});
    keys_.push_back(task.id);
    key_to_idx_.emplace(task.id, idx);
  }

  for (auto [from, node] : std::views::enumerate(nodes_)) {
    for (const auto& dep : node.task->dependencies) {
      ++edge_count_;
      auto to = get_index(dep);
      if (to == kInvalidNode) {
        dangling_.push_back({node.task->id, dep});
        continue;
      }
      node.deps.push_back(to);
      nodes_[to].dependents.push_back(static_cast<NodeIndex>(from));
    }
  }
}

auto TaskGraph::task_exists(const TaskId& id) const -> bool {
  return key_to_idx_.contains(id);
}

auto TaskGraph::find(const TaskId& id) const -> const Task* {
  auto idx = get_index(id);
  return idx != kInvalidNode ? nodes_[idx].task : nullptr;
}

auto TaskGraph::neighbors(const TaskId& id) const -> std::vector<TaskId> {
  auto idx = get_index(id);
  if (idx == kInvalidNode) {
    return {};
  }
  return nodes_[idx].task->dependencies;
}

auto TaskGraph::dependents(const TaskId& id) const -> std::vector<TaskId> {
  auto idx = get_index(id);
  if (idx == kInvalidNode) {
    return {};
  }
  std::vector<TaskId> result;
  std::unordered_set<NodeIndex> seen;
  for (NodeIndex d : nodes_[idx].dependents) {
    if (seen.insert(d).second) {
      result.push_back(keys_[d]);
    }
  }
  return result;
}

auto TaskGraph::all_task_ids() const -> std::unordered_set<TaskId> {
  return {keys_.begin(), keys_.end()};
}

auto TaskGraph::get_index(const TaskId& id) const -> NodeIndex {
  auto it = key_to_idx_.find(id);
  return it != key_to_idx_.end() ? it->second : kInvalidNode;
}

auto TaskGraph::get_key(NodeIndex idx) const -> const TaskId& {
  static const TaskId empty;
  if (idx >= keys_.size()) {
    return empty;
  }
  return keys_[idx];
}

auto TaskGraph::deps_view(NodeIndex idx) const noexcept
    -> std::span<const NodeIndex> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].deps;
}

auto TaskGraph::dependents_view(NodeIndex idx) const noexcept
    -> std::span<const NodeIndex> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].dependents;
}

auto TaskGraph::raw_deps(NodeIndex idx) const noexcept
    -> std::span<const TaskId> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].task->dependencies;
}

}  // namespace depgraph
