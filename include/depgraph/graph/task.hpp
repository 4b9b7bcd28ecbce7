#pragma once

#include "depgraph/util/id.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace depgraph {

enum class TaskStatus : std::uint8_t {
  Pending,
  InProgress,
  Completed,
  Blocked,
  Cancelled,
};

enum class TaskPriority : std::uint8_t {
  Low,
  Medium,
  High,
};

enum class DependencyType : std::uint8_t {
  Blocking,
  Related,
  Optional,
  FinishToStart,
  StartToStart,
  FinishToFinish,
  StartToFinish,
};

namespace detail {

constexpr std::array<std::string_view, 5> kTaskStatusNames = {
    "pending", "in-progress", "completed", "blocked", "cancelled",
};

constexpr std::array<std::string_view, 3> kTaskPriorityNames = {
    "low", "medium", "high",
};

constexpr std::array<std::string_view, 7> kDependencyTypeNames = {
    "blocking",         "related",          "optional",
    "finish-to-start",  "start-to-start",   "finish-to-finish",
    "start-to-finish",
};

}  // namespace detail

[[nodiscard]] auto to_string_view(TaskStatus status) noexcept -> std::string_view;
[[nodiscard]] auto to_string_view(TaskPriority priority) noexcept -> std::string_view;
[[nodiscard]] auto to_string_view(DependencyType type) noexcept -> std::string_view;

// Unrecognized names yield nullopt; callers keep the raw text instead.
[[nodiscard]] auto parse_task_status(std::string_view name) noexcept
    -> std::optional<TaskStatus>;
[[nodiscard]] auto parse_task_priority(std::string_view name) noexcept
    -> std::optional<TaskPriority>;
[[nodiscard]] auto parse_dependency_type(std::string_view name) noexcept
    -> std::optional<DependencyType>;

inline constexpr std::string_view kDefaultDependencyType = "blocking";

// Optional fields stay unset when the document omits them, so a loaded entry
// is written back with the same keys.
struct DetailedDependency {
  TaskId task_id;
  // Wire name; a forced unknown type is stored verbatim. Unset reads as
  // blocking.
  std::optional<std::string> type;
  std::optional<std::string> added_at;
  std::optional<std::string> reason;
  std::optional<std::string> added_by;
  nlohmann::json extra = nlohmann::json::object();

  [[nodiscard]] auto dependency_type() const noexcept
      -> std::optional<DependencyType> {
    return parse_dependency_type(type ? std::string_view{*type}
                                      : kDefaultDependencyType);
  }
};

struct Task {
  TaskId id;
  std::optional<std::string> title;
  std::optional<std::string> description;
  std::optional<TaskStatus> status;
  std::optional<TaskPriority> priority;
  std::optional<double> effort;
  std::optional<std::vector<std::string>> skills;
  std::vector<TaskId> dependencies;
  // False when a loaded record had no array under "dependencies"; an empty
  // list is then left out on save.
  bool dependencies_present{true};
  std::optional<std::vector<DetailedDependency>> detailed_dependencies;
  std::optional<std::string> updated_at;
  // Fields the engine does not own, passed through verbatim.
  nlohmann::json extra = nlohmann::json::object();

  [[nodiscard]] auto depends_on(const TaskId& other) const -> bool;

  // Removes every simple and detailed entry for `target`; returns the number
  // of simple entries removed. An emptied detailed list becomes absent.
  auto erase_dependency(const TaskId& target) -> std::size_t;

  auto touch() -> void;
};

struct DependencyStats {
  // Unset when the document has no integer there; a raw value stays in
  // `extra`.
  std::optional<std::int64_t> total_dependencies;
  std::optional<std::string> last_updated;
  nlohmann::json extra = nlohmann::json::object();
};

struct CollectionMetadata {
  std::optional<DependencyStats> dependencies;
  std::optional<bool> use_detailed_dependencies;
  nlohmann::json extra = nlohmann::json::object();
  // The document carried a metadata object, possibly empty.
  bool present{false};
};

struct TaskCollection {
  CollectionMetadata metadata;
  std::vector<Task> tasks;
  nlohmann::json extra = nlohmann::json::object();

  [[nodiscard]] auto find(const TaskId& id) -> Task*;
  [[nodiscard]] auto find(const TaskId& id) const -> const Task*;

  [[nodiscard]] auto detailed_dependencies_enabled() const noexcept -> bool {
    return metadata.use_detailed_dependencies.value_or(true);
  }

  [[nodiscard]] auto total_dependencies() const noexcept -> std::int64_t {
    return metadata.dependencies
               ? metadata.dependencies->total_dependencies.value_or(0)
               : 0;
  }

  // Incremental counter maintenance; the total never drops below zero.
  auto adjust_dependency_count(std::int64_t delta) -> void;

  // Recomputes the counter from the task records.
  auto recount_dependencies() -> std::int64_t;
};

}  // namespace depgraph
