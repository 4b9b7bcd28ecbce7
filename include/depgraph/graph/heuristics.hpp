#pragma once

#include "depgraph/graph/task.hpp"
#include "depgraph/graph/task_graph.hpp"

#include <optional>
#include <string>
#include <vector>

namespace depgraph::heuristics {

// Title keyword classes, matched case-insensitively as substrings.
[[nodiscard]] auto is_setup_task(const Task& task) -> bool;
[[nodiscard]] auto is_design_task(const Task& task) -> bool;
[[nodiscard]] auto is_testing_task(const Task& task) -> bool;
// `implement` or `develop` in the title.
[[nodiscard]] auto is_implementation_task(const Task& task) -> bool;

// Component words (database, api, service, ...) present in both
// descriptions, in a fixed order.
[[nodiscard]] auto shared_components(const Task& task, const Task& dependency)
    -> std::vector<std::string>;

[[nodiscard]] auto shared_skills(const Task& task, const Task& dependency)
    -> std::vector<std::string>;

// Reason string when the task's content suggests it genuinely needs
// `dependency` (setup before implementation, design before build, shared
// components).
[[nodiscard]] auto infer_logical_dependency(const Task& task,
                                            const Task& dependency)
    -> std::optional<std::string>;

// High priority and at least one dependency or dependent. This is a
// heuristic flag, not a critical-path-method computation.
[[nodiscard]] auto is_on_critical_path(const TaskGraph& graph, const TaskId& id)
    -> bool;

}  // namespace depgraph::heuristics
