#include "depgraph/graph/edge_type_validator.hpp"

#include <utility>

namespace depgraph {

namespace {

[[nodiscard]] auto reject(std::string reason) -> TypeValidation {
  return {.is_valid = false, .reason = std::move(reason)};
}

}  // namespace

auto EdgeTypeValidator::validate(const Task& task, const Task& dependency,
                                 std::string_view type) -> TypeValidation {
  auto parsed = parse_dependency_type(type);
  if (!parsed) {
    return reject("unknown dependency type");
  }
  return validate(task, dependency, *parsed);
}

auto EdgeTypeValidator::validate(const Task& task, const Task& dependency,
                                 DependencyType type) -> TypeValidation {
  switch (type) {
    case DependencyType::Blocking:
      if (task.priority == TaskPriority::High &&
          dependency.priority == TaskPriority::Low) {
        return reject(
            "High priority task should not be blocked by low priority task");
      }
      break;

    case DependencyType::FinishToStart:
      if (dependency.status == TaskStatus::Pending &&
          task.status == TaskStatus::Completed) {
        return reject(
            "Cannot create finish-to-start dependency: dependent task is "
            "completed while dependency is pending");
      }
      break;

    case DependencyType::StartToStart:
      if (task.status != TaskStatus::Pending &&
          dependency.status == TaskStatus::Pending) {
        return reject(
            "Cannot create start-to-start dependency: task has started but "
            "dependency has not");
      }
      break;

    case DependencyType::FinishToFinish:
      if (task.status == TaskStatus::Completed &&
          dependency.status != TaskStatus::Completed) {
        return reject(
            "Cannot create finish-to-finish dependency: task is completed but "
            "dependency is not");
      }
      break;

    case DependencyType::StartToFinish:
      if (task.status == TaskStatus::Completed &&
          dependency.status == TaskStatus::Pending) {
        return reject(
            "Cannot create start-to-finish dependency: task is completed but "
            "dependency has not started");
      }
      break;

    case DependencyType::Related:
    case DependencyType::Optional:
      break;
  }
  return {};
}

}  // namespace depgraph
