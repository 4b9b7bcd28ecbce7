#pragma once

#include "depgraph/graph/task_graph.hpp"
#include "depgraph/util/id.hpp"

#include <vector>

namespace depgraph {

struct CycleCheck {
  bool has_cycle{false};
  // Closed path: the first and last element are the re-visited task.
  std::vector<TaskId> cycle_path;
};

class CycleDetector {
public:
  // Checks whether adding `from -> to` would close a cycle. Only cycles that
  // run through the candidate edge are reported; cycles already present in
  // the graph are left to the full audit.
  [[nodiscard]] static auto would_create_cycle(const TaskGraph& graph,
                                               const TaskId& from,
                                               const TaskId& to) -> CycleCheck;

  // One DFS pass over the whole graph, one path per back edge.
  [[nodiscard]] static auto find_all_cycles(const TaskGraph& graph)
      -> std::vector<std::vector<TaskId>>;

  [[nodiscard]] static auto has_cycles(const TaskGraph& graph) -> bool;
};

}  // namespace depgraph
