#include "depgraph/graph/analysis.hpp"

#include "depgraph/graph/reachability.hpp"
#include "depgraph/util/log.hpp"

#include <algorithm>
#include <deque>
#include <ranges>
#include <unordered_set>
#include <utility>

namespace depgraph {

namespace {

[[nodiscard]] auto priority_weight(const Task& task) noexcept -> double {
  if (!task.priority) {
    return 1.0;
  }
  switch (*task.priority) {
    case TaskPriority::High:
      return 3.0;
    case TaskPriority::Medium:
      return 2.0;
    case TaskPriority::Low:
      return 1.0;
  }
  return 1.0;
}

}  // namespace

auto analyze_impact(const TaskGraph& graph) -> std::vector<TaskImpact> {
  std::vector<TaskImpact> result;
  result.reserve(graph.size());
  for (NodeIndex idx = 0; idx < graph.size(); ++idx) {
    const auto& id = graph.get_key(idx);
    TaskImpact impact{.id = id};
    impact.direct_dependencies = graph.raw_deps(idx).size();
    impact.direct_dependents = graph.dependents(id).size();
    impact.total_impact = Reachability::transitive_dependents(graph, id).size();
    impact.impact_score = impact.direct_dependents * 2 + impact.total_impact;
    impact.is_critical = impact.direct_dependents >= 3 || impact.total_impact >= 5;
    result.push_back(std::move(impact));
  }
  return result;
}

auto extract_subgraph(const TaskGraph& graph, const TaskId& focus,
                      std::size_t max_depth) -> Result<std::vector<TaskId>> {
  auto start = graph.get_index(focus);
  if (start == kInvalidNode) {
    log::error("Focus task not found: {}", focus);
    return fail(Error::NotFound);
  }

  std::vector<bool> included(graph.size(), false);
  std::deque<std::pair<NodeIndex, std::size_t>> queue;
  included[start] = true;
  queue.emplace_back(start, 0);

  while (!queue.empty()) {
    auto [idx, depth] = queue.front();
    queue.pop_front();
    if (max_depth > 0 && depth >= max_depth) {
      continue;
    }
    auto visit = [&](NodeIndex next) {
      if (!included[next]) {
        included[next] = true;
        queue.emplace_back(next, depth + 1);
      }
    };
    for (auto dep : graph.deps_view(idx)) visit(dep);
    for (auto dependent : graph.dependents_view(idx)) visit(dependent);
  }

  std::vector<TaskId> result;
  for (NodeIndex idx = 0; idx < graph.size(); ++idx) {
    if (included[idx]) {
      result.push_back(graph.get_key(idx));
    }
  }
  return result;
}

auto rank_critical_tasks(const TaskGraph& graph) -> std::vector<TaskId> {
  std::vector<std::pair<double, NodeIndex>> ranked;
  for (NodeIndex idx = 0; idx < graph.size(); ++idx) {
    const auto& task = graph.task(idx);
    bool high_priority = task.priority == TaskPriority::High;
    bool high_effort = task.effort.value_or(0.0) >= 4.0;
    bool has_dependents = !graph.dependents_view(idx).empty();
    if (high_priority || (high_effort && has_dependents)) {
      // Missing or zero effort weighs as 1.
      double effort = task.effort.value_or(0.0);
      if (effort == 0.0) effort = 1.0;
      ranked.emplace_back(priority_weight(task) * effort, idx);
    }
  }

  std::ranges::stable_sort(ranked, std::ranges::greater{},
                           &std::pair<double, NodeIndex>::first);

  return ranked | std::views::transform([&](const auto& entry) {
           return graph.get_key(entry.second);
         }) |
         std::ranges::to<std::vector>();
}

auto compute_metrics(const TaskGraph& graph) -> DependencyMetrics {
  DependencyMetrics metrics;
  metrics.total_tasks = graph.size();

  auto chains = Reachability::all_chain_lengths(graph);
  for (NodeIndex idx = 0; idx < graph.size(); ++idx) {
    auto count = graph.raw_deps(idx).size();
    if (count > 0) {
      ++metrics.tasks_with_dependencies;
      metrics.total_dependencies += count;
      metrics.max_dependencies = std::max(metrics.max_dependencies, count);
    } else {
      ++metrics.tasks_with_no_dependencies;
    }
    if (graph.dependents_view(idx).empty()) {
      ++metrics.tasks_with_no_dependents;
    }
    metrics.longest_dependency_chain =
        std::max(metrics.longest_dependency_chain, chains[idx]);
    ++metrics.dependency_distribution[count];
  }

  if (metrics.total_tasks > 0) {
    metrics.average_dependencies_per_task =
        static_cast<double>(metrics.total_dependencies) /
        static_cast<double>(metrics.total_tasks);
  }
  return metrics;
}

}  // namespace depgraph
