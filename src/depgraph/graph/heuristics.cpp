#include "depgraph/graph/heuristics.hpp"

#include "depgraph/util/util.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <string_view>

namespace depgraph::heuristics {

namespace {

constexpr std::array<std::string_view, 7> kComponentWords = {
    "database", "api", "service", "interface", "component", "module", "system",
};

[[nodiscard]] auto title_of(const Task& task) -> std::string {
  return task.title ? to_lower(*task.title) : std::string{};
}

[[nodiscard]] auto description_of(const Task& task) -> std::string {
  return to_lower(task.description.value_or(""));
}

}  // namespace

auto is_setup_task(const Task& task) -> bool {
  return contains_any(title_of(task),
                      {"setup", "configure", "install", "initialize"});
}

auto is_design_task(const Task& task) -> bool {
  return contains_any(title_of(task), {"design", "architecture", "plan"});
}

auto is_testing_task(const Task& task) -> bool {
  return contains_any(title_of(task), {"test"});
}

auto is_implementation_task(const Task& task) -> bool {
  return contains_any(title_of(task), {"implement", "develop"});
}

auto shared_components(const Task& task, const Task& dependency)
    -> std::vector<std::string> {
  auto lhs = description_of(task);
  auto rhs = description_of(dependency);
  std::vector<std::string> shared;
  for (auto word : kComponentWords) {
    if (lhs.find(word) != std::string::npos &&
        rhs.find(word) != std::string::npos) {
      shared.emplace_back(word);
    }
  }
  return shared;
}

auto shared_skills(const Task& task, const Task& dependency)
    -> std::vector<std::string> {
  if (!task.skills || !dependency.skills) {
    return {};
  }
  std::vector<std::string> shared;
  for (const auto& skill : *task.skills) {
    if (std::ranges::contains(*dependency.skills, skill) &&
        !std::ranges::contains(shared, skill)) {
      shared.push_back(skill);
    }
  }
  return shared;
}

auto infer_logical_dependency(const Task& task, const Task& dependency)
    -> std::optional<std::string> {
  auto task_title = title_of(task);

  if (is_setup_task(dependency) &&
      contains_any(task_title, {"implement", "develop"})) {
    return "Setup/configuration tasks typically should complete before "
           "implementation";
  }

  if (is_design_task(dependency) &&
      contains_any(task_title, {"implement", "build"})) {
    return "Design tasks should typically complete before implementation";
  }

  if (auto shared = shared_components(task, dependency); !shared.empty()) {
    std::string joined;
    for (const auto& word : shared) {
      if (!joined.empty()) joined += ", ";
      joined += word;
    }
    return std::format("Tasks share common components: {}", joined);
  }

  return std::nullopt;
}

auto is_on_critical_path(const TaskGraph& graph, const TaskId& id) -> bool {
  auto idx = graph.get_index(id);
  if (idx == kInvalidNode) {
    return false;
  }
  const auto& task = graph.task(idx);
  if (task.priority != TaskPriority::High) {
    return false;
  }
  return !task.dependencies.empty() || !graph.dependents_view(idx).empty();
}

}  // namespace depgraph::heuristics
