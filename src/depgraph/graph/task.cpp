#include "depgraph/graph/task.hpp"

#include "depgraph/util/util.hpp"

#include <algorithm>
#include <ranges>
#include <utility>

namespace depgraph {

namespace {

template <typename Enum, std::size_t N>
[[nodiscard]] auto name_of(const std::array<std::string_view, N>& names,
                           Enum value) noexcept -> std::string_view {
  auto idx = std::to_underlying(value);
  return idx < names.size() ? names[idx] : std::string_view{"unknown"};
}

template <typename Enum, std::size_t N>
[[nodiscard]] auto parse_name(const std::array<std::string_view, N>& names,
                              std::string_view name) noexcept
    -> std::optional<Enum> {
  auto it = std::ranges::find(names, name);
  if (it == names.end()) {
    return std::nullopt;
  }
  return static_cast<Enum>(std::ranges::distance(names.begin(), it));
}

}  // namespace

auto to_string_view(TaskStatus status) noexcept -> std::string_view {
  return name_of(detail::kTaskStatusNames, status);
}

auto to_string_view(TaskPriority priority) noexcept -> std::string_view {
  return name_of(detail::kTaskPriorityNames, priority);
}

auto to_string_view(DependencyType type) noexcept -> std::string_view {
  return name_of(detail::kDependencyTypeNames, type);
}

auto parse_task_status(std::string_view name) noexcept
    -> std::optional<TaskStatus> {
  return parse_name<TaskStatus>(detail::kTaskStatusNames, name);
}

auto parse_task_priority(std::string_view name) noexcept
    -> std::optional<TaskPriority> {
  return parse_name<TaskPriority>(detail::kTaskPriorityNames, name);
}

auto parse_dependency_type(std::string_view name) noexcept
    -> std::optional<DependencyType> {
  return parse_name<DependencyType>(detail::kDependencyTypeNames, name);
}

auto Task::depends_on(const TaskId& other) const -> bool {
  return std::ranges::contains(dependencies, other);
}

auto Task::erase_dependency(const TaskId& target) -> std::size_t {
  auto removed = std::erase(dependencies, target);
  if (detailed_dependencies) {
    std::erase_if(*detailed_dependencies, [&](const DetailedDependency& d) {
      return d.task_id == target;
    });
    if (detailed_dependencies->empty()) {
      detailed_dependencies.reset();
    }
  }
  return removed;
}

auto Task::touch() -> void {
  updated_at = format_timestamp();
}

auto TaskCollection::find(const TaskId& id) -> Task* {
  auto it = std::ranges::find(tasks, id, &Task::id);
  return it != tasks.end() ? &*it : nullptr;
}

auto TaskCollection::find(const TaskId& id) const -> const Task* {
  auto it = std::ranges::find(tasks, id, &Task::id);
  return it != tasks.end() ? &*it : nullptr;
}

auto TaskCollection::adjust_dependency_count(std::int64_t delta) -> void {
  if (!metadata.dependencies) {
    metadata.dependencies = DependencyStats{};
  }
  auto& stats = *metadata.dependencies;
  stats.total_dependencies = std::max<std::int64_t>(
      0, stats.total_dependencies.value_or(0) + delta);
  stats.last_updated = format_timestamp();
}

auto TaskCollection::recount_dependencies() -> std::int64_t {
  std::int64_t total = 0;
  for (const auto& task : tasks) {
    total += static_cast<std::int64_t>(task.dependencies.size());
  }
  if (!metadata.dependencies) {
    metadata.dependencies = DependencyStats{};
  }
  metadata.dependencies->total_dependencies = total;
  metadata.dependencies->last_updated = format_timestamp();
  return total;
}

}  // namespace depgraph
