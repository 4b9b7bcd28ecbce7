#include "depgraph/graph/reachability.hpp"

#include <algorithm>
#include <queue>
#include <unordered_set>

namespace depgraph {

namespace {

// BFS with parent links. Returns the path to `to` or empty.
[[nodiscard]] auto bfs_path(const TaskGraph& graph, const TaskId& from,
                            const TaskId& to, bool skip_direct,
                            NodeIndex excluded = kInvalidNode)
    -> std::vector<TaskId> {
  auto start = graph.get_index(from);
  if (start == kInvalidNode || start == excluded) {
    return {};
  }

  std::vector<NodeIndex> parent(graph.size(), kInvalidNode);
  std::vector<bool> visited(graph.size(), false);
  visited[start] = true;
  if (excluded != kInvalidNode) {
    visited[excluded] = true;
  }

  std::queue<NodeIndex> queue;
  queue.push(start);

  while (!queue.empty()) {
    auto current = queue.front();
    queue.pop();

    for (const auto& dep : graph.raw_deps(current)) {
      if (dep == to) {
        if (skip_direct && current == start) {
          continue;
        }
        std::vector<TaskId> path{to};
        for (auto at = current; at != kInvalidNode; at = parent[at]) {
          path.push_back(graph.get_key(at));
        }
        std::ranges::reverse(path);
        return path;
      }
      auto next = graph.get_index(dep);
      if (next != kInvalidNode && !visited[next]) {
        visited[next] = true;
        parent[next] = current;
        queue.push(next);
      }
    }
  }
  return {};
}

// Chain lengths over the condensation of the graph. Tasks in one strongly
// connected component share a chain: the component size plus the longest
// chain among the components it depends on. A dangling id counts 1.
// Iterative Tarjan; components complete in reverse topological order, so
// every dependency component is final before its dependents need it.
class ChainLengths {
public:
  explicit ChainLengths(const TaskGraph& graph)
      : graph_(graph),
        index_(graph.size(), kUnvisited),
        low_(graph.size(), 0),
        on_stack_(graph.size(), false),
        component_(graph.size(), kUnvisited) {}

  auto compute(NodeIndex root) -> std::size_t {
    if (index_[root] == kUnvisited) {
      visit(root);
    }
    return chains_[component_[root]];
  }

private:
  static constexpr std::size_t kUnvisited = static_cast<std::size_t>(-1);

  struct Frame {
    NodeIndex node;
    std::size_t next{0};
  };

  auto visit(NodeIndex root) -> void {
    std::vector<Frame> frames;
    enter(root);
    frames.push_back({root});

    while (!frames.empty()) {
      auto& frame = frames.back();
      auto deps = graph_.raw_deps(frame.node);

      if (frame.next < deps.size()) {
        auto idx = graph_.get_index(deps[frame.next++]);
        if (idx == kInvalidNode) {
          continue;
        }
        if (index_[idx] == kUnvisited) {
          enter(idx);
          frames.push_back({idx});
        } else if (on_stack_[idx]) {
          low_[frame.node] = std::min(low_[frame.node], index_[idx]);
        }
        continue;
      }

      auto node = frame.node;
      frames.pop_back();
      if (low_[node] == index_[node]) {
        close_component(node);
      }
      if (!frames.empty()) {
        auto parent = frames.back().node;
        low_[parent] = std::min(low_[parent], low_[node]);
      }
    }
  }

  auto enter(NodeIndex node) -> void {
    index_[node] = low_[node] = next_index_++;
    on_stack_[node] = true;
    stack_.push_back(node);
  }

  auto close_component(NodeIndex head) -> void {
    auto id = chains_.size();
    auto first = std::ranges::find(stack_, head);
    std::vector<NodeIndex> members(first, stack_.end());
    stack_.erase(first, stack_.end());
    for (auto member : members) {
      on_stack_[member] = false;
      component_[member] = id;
    }

    std::size_t best = 0;
    for (auto member : members) {
      for (const auto& dep : graph_.raw_deps(member)) {
        auto idx = graph_.get_index(dep);
        if (idx == kInvalidNode) {
          best = std::max<std::size_t>(best, 1);
        } else if (component_[idx] != id) {
          best = std::max(best, chains_[component_[idx]]);
        }
      }
    }
    chains_.push_back(members.size() + best);
  }

  const TaskGraph& graph_;
  std::vector<std::size_t> index_;
  std::vector<std::size_t> low_;
  std::vector<bool> on_stack_;
  std::vector<std::size_t> component_;
  std::vector<NodeIndex> stack_;
  std::vector<std::size_t> chains_;
  std::size_t next_index_{0};
};

}  // namespace

auto Reachability::has_path(const TaskGraph& graph, const TaskId& from,
                            const TaskId& to, bool exclude_direct_edge)
    -> bool {
  return !bfs_path(graph, from, to, exclude_direct_edge).empty();
}

auto Reachability::find_indirect_path(const TaskGraph& graph,
                                      const TaskId& from, const TaskId& to)
    -> std::vector<TaskId> {
  return bfs_path(graph, from, to, true);
}

auto Reachability::has_path_avoiding(const TaskGraph& graph,
                                     const TaskId& from, const TaskId& to,
                                     const TaskId& excluded) -> bool {
  return !bfs_path(graph, from, to, false, graph.get_index(excluded)).empty();
}

auto Reachability::chain_length(const TaskGraph& graph, const TaskId& id)
    -> std::size_t {
  auto idx = graph.get_index(id);
  if (idx == kInvalidNode) {
    return 1;
  }
  ChainLengths lengths(graph);
  return lengths.compute(idx);
}

auto Reachability::all_chain_lengths(const TaskGraph& graph)
    -> std::vector<std::size_t> {
  ChainLengths lengths(graph);
  std::vector<std::size_t> result(graph.size(), 1);
  for (NodeIndex i = 0; i < graph.size(); ++i) {
    result[i] = lengths.compute(i);
  }
  return result;
}

auto Reachability::transitive_dependencies(const TaskGraph& graph,
                                           const TaskId& id)
    -> std::vector<TaskId> {
  std::vector<TaskId> chain;
  std::unordered_set<TaskId> emitted;
  std::unordered_set<TaskId> expanded{id};

  struct Frame {
    std::span<const TaskId> deps;
    std::size_t next{0};
  };
  std::vector<Frame> stack;
  if (auto idx = graph.get_index(id); idx != kInvalidNode) {
    stack.push_back({graph.raw_deps(idx)});
  }

  while (!stack.empty()) {
    auto& frame = stack.back();
    if (frame.next >= frame.deps.size()) {
      stack.pop_back();
      continue;
    }
    const auto& dep = frame.deps[frame.next++];
    if (emitted.insert(dep).second) {
      chain.push_back(dep);
    }
    if (!expanded.insert(dep).second) {
      continue;
    }
    if (auto idx = graph.get_index(dep); idx != kInvalidNode) {
      stack.push_back({graph.raw_deps(idx)});
    }
  }
  return chain;
}

auto Reachability::transitive_dependents(const TaskGraph& graph,
                                         const TaskId& id)
    -> std::vector<TaskId> {
  auto start = graph.get_index(id);
  if (start == kInvalidNode) {
    return {};
  }

  std::vector<TaskId> result;
  std::vector<bool> visited(graph.size(), false);
  visited[start] = true;
  std::queue<NodeIndex> queue;
  queue.push(start);

  while (!queue.empty()) {
    auto current = queue.front();
    queue.pop();
    for (NodeIndex dependent : graph.dependents_view(current)) {
      if (!visited[dependent]) {
        visited[dependent] = true;
        result.push_back(graph.get_key(dependent));
        queue.push(dependent);
      }
    }
  }
  return result;
}

}  // namespace depgraph
