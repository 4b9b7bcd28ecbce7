#include "depgraph/graph/cycle_detector.hpp"

#include <algorithm>
#include <cstdint>
#include <queue>
#include <ranges>

namespace depgraph {

namespace {

enum class Mark : std::uint8_t { Unvisited, OnStack, Done };

struct ExtraEdge {
  NodeIndex from{kInvalidNode};
  NodeIndex to{kInvalidNode};
};

// Iterative DFS over every node in collection order. Children are visited in
// dependency order, the optional extra edge last, which is the order a
// recursive walk would take. `on_cycle` receives the closed path for every
// back edge and returns true to stop the walk.
template <typename OnCycle>
auto walk_back_edges(const TaskGraph& graph, ExtraEdge extra, OnCycle&& on_cycle)
    -> void {
  const auto n = graph.size();
  std::vector<Mark> mark(n, Mark::Unvisited);
  std::vector<std::pair<NodeIndex, std::size_t>> stack;
  std::vector<NodeIndex> path;

  auto child_count = [&](NodeIndex node) {
    auto count = graph.deps_view(node).size();
    return node == extra.from ? count + 1 : count;
  };
  auto child_at = [&](NodeIndex node, std::size_t i) {
    auto deps = graph.deps_view(node);
    return i < deps.size() ? deps[i] : extra.to;
  };

  for (NodeIndex start : std::views::iota(NodeIndex{0}, static_cast<NodeIndex>(n))) {
    if (mark[start] != Mark::Unvisited)
      continue;

    mark[start] = Mark::OnStack;
    stack.push_back({start, 0});
    path.push_back(start);

    while (!stack.empty()) {
      auto& [node, child_idx] = stack.back();

      if (child_idx < child_count(node)) {
        NodeIndex child = child_at(node, child_idx++);
        if (mark[child] == Mark::OnStack) {
          auto first = std::ranges::find(path, child);
          std::vector<TaskId> cycle;
          cycle.reserve(static_cast<std::size_t>(path.end() - first) + 1);
          for (auto it = first; it != path.end(); ++it) {
            cycle.push_back(graph.get_key(*it));
          }
          cycle.push_back(graph.get_key(child));
          if (on_cycle(std::move(cycle))) {
            return;
          }
        } else if (mark[child] == Mark::Unvisited) {
          mark[child] = Mark::OnStack;
          stack.push_back({child, 0});
          path.push_back(child);
        }
      } else {
        mark[node] = Mark::Done;
        stack.pop_back();
        path.pop_back();
      }
    }
  }
}

[[nodiscard]] auto contains_edge(const std::vector<TaskId>& cycle,
                                 const TaskId& from, const TaskId& to) -> bool {
  for (std::size_t i = 0; i + 1 < cycle.size(); ++i) {
    if (cycle[i] == from && cycle[i + 1] == to) {
      return true;
    }
  }
  return false;
}

// Shortest dependency path from `to` back to `from`, reported as
// [from, to, ..., from].
[[nodiscard]] auto path_back(const TaskGraph& graph, NodeIndex from, NodeIndex to)
    -> std::vector<TaskId> {
  std::vector<NodeIndex> parent(graph.size(), kInvalidNode);
  std::vector<bool> seen(graph.size(), false);
  std::queue<NodeIndex> queue;
  queue.push(to);
  seen[to] = true;

  while (!queue.empty()) {
    auto current = queue.front();
    queue.pop();
    if (current == from) {
      std::vector<TaskId> reversed;
      for (auto at = from; at != kInvalidNode; at = parent[at]) {
        reversed.push_back(graph.get_key(at));
      }
      std::vector<TaskId> cycle{graph.get_key(from)};
      cycle.insert(cycle.end(), reversed.rbegin(), reversed.rend());
      return cycle;
    }
    for (NodeIndex dep : graph.deps_view(current)) {
      if (!seen[dep]) {
        seen[dep] = true;
        parent[dep] = current;
        queue.push(dep);
      }
    }
  }
  return {};
}

}  // namespace

auto CycleDetector::would_create_cycle(const TaskGraph& graph,
                                       const TaskId& from, const TaskId& to)
    -> CycleCheck {
  auto from_idx = graph.get_index(from);
  auto to_idx = graph.get_index(to);
  if (from_idx == kInvalidNode || to_idx == kInvalidNode) {
    return {};
  }
  if (from_idx == to_idx) {
    return {.has_cycle = true, .cycle_path = {from, from}};
  }

  CycleCheck result;
  walk_back_edges(graph, {from_idx, to_idx}, [&](std::vector<TaskId> cycle) {
    if (!contains_edge(cycle, from, to)) {
      return false;
    }
    result.has_cycle = true;
    result.cycle_path = std::move(cycle);
    return true;
  });

  if (!result.has_cycle) {
    // The ordered walk can reach the new edge's cycle only through nodes an
    // unrelated cycle already finished; search for the closing path directly.
    auto cycle = path_back(graph, from_idx, to_idx);
    if (!cycle.empty()) {
      result.has_cycle = true;
      result.cycle_path = std::move(cycle);
    }
  }
  return result;
}

auto CycleDetector::find_all_cycles(const TaskGraph& graph)
    -> std::vector<std::vector<TaskId>> {
  std::vector<std::vector<TaskId>> cycles;
  walk_back_edges(graph, {}, [&](std::vector<TaskId> cycle) {
    cycles.push_back(std::move(cycle));
    return false;
  });
  return cycles;
}

auto CycleDetector::has_cycles(const TaskGraph& graph) -> bool {
  bool found = false;
  walk_back_edges(graph, {}, [&](std::vector<TaskId>) {
    found = true;
    return true;
  });
  return found;
}

}  // namespace depgraph
