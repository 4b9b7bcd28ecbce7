#pragma once

#include "depgraph/core/error.hpp"
#include "depgraph/graph/task_graph.hpp"
#include "depgraph/util/id.hpp"

#include <cstddef>
#include <map>
#include <vector>

namespace depgraph {

struct TaskImpact {
  TaskId id;
  std::size_t direct_dependencies{0};
  std::size_t direct_dependents{0};
  // Distinct tasks that transitively depend on this one.
  std::size_t total_impact{0};
  std::size_t impact_score{0};
  bool is_critical{false};
};

struct DependencyMetrics {
  std::size_t total_tasks{0};
  std::size_t tasks_with_dependencies{0};
  std::size_t total_dependencies{0};
  double average_dependencies_per_task{0.0};
  std::size_t max_dependencies{0};
  std::size_t tasks_with_no_dependencies{0};
  std::size_t tasks_with_no_dependents{0};
  std::size_t longest_dependency_chain{0};
  // dependency count -> number of tasks with that many dependencies
  std::map<std::size_t, std::size_t> dependency_distribution;
};

// Per-task impact in collection order.
[[nodiscard]] auto analyze_impact(const TaskGraph& graph)
    -> std::vector<TaskImpact>;

// Tasks connected to `focus` in either direction within `max_depth` hops
// (0 means unlimited), in collection order.
[[nodiscard]] auto extract_subgraph(const TaskGraph& graph, const TaskId& focus,
                                    std::size_t max_depth = 0)
    -> Result<std::vector<TaskId>>;

// High priority tasks, plus tasks with effort >= 4 that something depends
// on, ordered by priority weight times effort.
[[nodiscard]] auto rank_critical_tasks(const TaskGraph& graph)
    -> std::vector<TaskId>;

[[nodiscard]] auto compute_metrics(const TaskGraph& graph) -> DependencyMetrics;

}  // namespace depgraph
