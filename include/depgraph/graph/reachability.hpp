#pragma once

#include "depgraph/graph/task_graph.hpp"
#include "depgraph/util/id.hpp"

#include <cstddef>
#include <vector>

namespace depgraph {

class Reachability {
public:
  // BFS over dependency edges. With `exclude_direct_edge`, first hops that
  // go straight to `to` are ignored, so only paths of two or more edges
  // count; that is the redundancy test for the edge `from -> to`.
  [[nodiscard]] static auto has_path(const TaskGraph& graph, const TaskId& from,
                                     const TaskId& to,
                                     bool exclude_direct_edge = true) -> bool;

  // Shortest path [from, ..., to] of at least two edges, or empty.
  [[nodiscard]] static auto find_indirect_path(const TaskGraph& graph,
                                               const TaskId& from,
                                               const TaskId& to)
      -> std::vector<TaskId>;

  // BFS from `from` that never enters `excluded`.
  [[nodiscard]] static auto has_path_avoiding(const TaskGraph& graph,
                                              const TaskId& from,
                                              const TaskId& to,
                                              const TaskId& excluded) -> bool;

  // Longest dependency chain starting at `id`, counted in tasks. A leaf (or
  // unknown id) is 1. Tasks caught in an existing cycle each count once:
  // every task of a strongly connected component gets the component size
  // plus the longest chain below it. Linear in the size of the graph.
  [[nodiscard]] static auto chain_length(const TaskGraph& graph,
                                         const TaskId& id) -> std::size_t;

  // chain_length for every task, indexed by NodeIndex.
  [[nodiscard]] static auto all_chain_lengths(const TaskGraph& graph)
      -> std::vector<std::size_t>;

  // Distinct ids reachable through dependencies, depth-first preorder.
  // Dangling ids are included.
  [[nodiscard]] static auto transitive_dependencies(const TaskGraph& graph,
                                                    const TaskId& id)
      -> std::vector<TaskId>;

  // Distinct tasks that reach `id` through dependencies, excluding `id`.
  [[nodiscard]] static auto transitive_dependents(const TaskGraph& graph,
                                                  const TaskId& id)
      -> std::vector<TaskId>;
};

}  // namespace depgraph
