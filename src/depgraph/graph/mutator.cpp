#include "depgraph/graph/mutator.hpp"

#include "depgraph/graph/cycle_detector.hpp"
#include "depgraph/graph/edge_type_validator.hpp"
#include "depgraph/graph/heuristics.hpp"
#include "depgraph/graph/reachability.hpp"
#include "depgraph/graph/task_graph.hpp"
#include "depgraph/util/log.hpp"
#include "depgraph/util/util.hpp"

#include <format>
#include <utility>

namespace depgraph {

namespace {

[[nodiscard]] auto make_error(Error kind, const TaskId& task_id,
                              const TaskId& depends_on, std::string reason)
    -> std::unexpected<MutationError> {
  return std::unexpected{MutationError{
      .code = make_error_code(kind),
      .task_id = task_id,
      .depends_on = depends_on,
      .reason = std::move(reason),
  }};
}

[[nodiscard]] auto display_name(const Task& task) -> std::string {
  return task.title && !task.title->empty() ? *task.title : task.id.str();
}

}  // namespace

auto MutationError::message() const -> std::string {
  if (reason.empty()) {
    return code.message();
  }
  return std::format("{}: {}", code.message(), reason);
}

DependencyMutator::DependencyMutator(TaskCollection& collection,
                                     ChangeLogSink* change_log)
    : collection_(collection), change_log_(change_log) {}

auto DependencyMutator::add_dependency(const TaskId& task_id,
                                       const TaskId& depends_on,
                                       const AddOptions& options)
    -> MutationResult<AddOutcome> {
  if (task_id == depends_on) {
    return make_error(Error::SelfDependency, task_id, depends_on,
                      std::format("task '{}' cannot depend on itself", task_id));
  }

  auto* task = collection_.find(task_id);
  if (task == nullptr) {
    return make_error(Error::TaskNotFound, task_id, depends_on,
                      std::format("task '{}'", task_id));
  }
  const auto* dependency = collection_.find(depends_on);
  if (dependency == nullptr) {
    return make_error(Error::TaskNotFound, task_id, depends_on,
                      std::format("dependency task '{}'", depends_on));
  }

  AddOutcome outcome;
  if (task->depends_on(depends_on)) {
    log::info("Dependency already exists: {} -> {}", task_id, depends_on);
    outcome.already_exists = true;
    outcome.task_dependency_count = task->dependencies.size();
    return outcome;
  }

  if (options.validate_cycles) {
    TaskGraph graph(collection_);
    auto check = CycleDetector::would_create_cycle(graph, task_id, depends_on);
    if (check.has_cycle) {
      auto path = join_path(check.cycle_path);
      if (!options.force) {
        auto err = make_error(Error::CircularDependency, task_id, depends_on,
                              std::format("cycle path: {}", path));
        err.error().cycle_path = std::move(check.cycle_path);
        return err;
      }
      log::warn("Forcing dependency {} -> {} despite circular dependency: {}",
                task_id, depends_on, path);
      outcome.forced_cycle = true;
      outcome.warnings.push_back(
          std::format("Dependency creates a circular dependency: {}", path));
      outcome.cycle_path = std::move(check.cycle_path);
    }
  }

  auto validation = EdgeTypeValidator::validate(*task, *dependency, options.type);
  if (!validation.is_valid) {
    if (!options.force) {
      return make_error(Error::DependencyType, task_id, depends_on,
                        std::move(validation.reason));
    }
    log::warn("Forcing {} dependency {} -> {} despite type check: {}",
              options.type, task_id, depends_on, validation.reason);
    outcome.forced_type = true;
    outcome.warnings.push_back(std::move(validation.reason));
  }

  auto now = format_timestamp();
  auto reason = options.reason.empty()
                    ? std::format("{} dependency", options.type)
                    : options.reason;

  // A detailed list is only started on a task without simple dependencies,
  // so the two lists never disagree in length.
  bool keep_detailed = task->detailed_dependencies.has_value() ||
                       (collection_.detailed_dependencies_enabled() &&
                        task->dependencies.empty());
  task->dependencies.push_back(depends_on);
  if (keep_detailed) {
    if (!task->detailed_dependencies) {
      task->detailed_dependencies.emplace();
    }
    task->detailed_dependencies->push_back(DetailedDependency{
        .task_id = depends_on,
        .type = options.type,
        .added_at = now,
        .reason = reason,
        .added_by = options.added_by,
    });
  }
  task->updated_at = now;
  collection_.adjust_dependency_count(+1);

  record(ChangeRecord{
      .action = ChangeAction::Add,
      .task_id = task_id,
      .depends_on = depends_on,
      .type = options.type,
      .reason = options.reason.empty() ? std::nullopt
                                       : std::optional<std::string>{options.reason},
      .forced = outcome.forced_cycle || outcome.forced_type,
      .timestamp = now,
  });

  TaskGraph graph(collection_);
  outcome.impact.dependent_count = graph.dependents(task_id).size();
  outcome.impact.chain_size =
      Reachability::transitive_dependencies(graph, depends_on).size();
  outcome.impact.affected_count =
      outcome.impact.dependent_count + outcome.impact.chain_size;
  outcome.impact.on_critical_path =
      heuristics::is_on_critical_path(graph, task_id) ||
      heuristics::is_on_critical_path(graph, depends_on);
  outcome.task_dependency_count = task->dependencies.size();

  log::info("Added {} dependency: {} -> {} ({} tasks potentially affected)",
            options.type, task_id, depends_on, outcome.impact.affected_count);
  return outcome;
}

auto DependencyMutator::remove_dependency(const TaskId& task_id,
                                          const TaskId& depends_on,
                                          const RemoveOptions& options)
    -> MutationResult<RemoveOutcome> {
  auto* task = collection_.find(task_id);
  if (task == nullptr) {
    return make_error(Error::TaskNotFound, task_id, depends_on,
                      std::format("task '{}'", task_id));
  }

  RemoveOutcome outcome;
  if (!task->depends_on(depends_on)) {
    log::info("Dependency does not exist: {} -> {}", task_id, depends_on);
    outcome.existed = false;
    outcome.original_dependency_count = task->dependencies.size();
    outcome.remaining_dependencies = task->dependencies.size();
    return outcome;
  }

  if (options.analyze_impact) {
    auto impact = analyze_removal(task_id, depends_on);
    if (!impact) {
      return std::unexpected{std::move(impact.error())};
    }
    if (impact->has_blocking_warnings()) {
      if (!options.force) {
        auto err = make_error(Error::RemovalWarning, task_id, depends_on,
                              std::format("{} warning(s)",
                                          impact->blocking_warnings.size()));
        err.error().warnings = impact->blocking_warnings;
        return err;
      }
      for (const auto& warning : impact->blocking_warnings) {
        log::warn("Forcing removal of {} -> {}: {}", task_id, depends_on,
                  warning);
      }
      outcome.forced = true;
    }
    outcome.impact = std::move(*impact);
  }

  outcome.original_dependency_count = task->dependencies.size();
  auto removed = task->erase_dependency(depends_on);
  task->touch();
  collection_.adjust_dependency_count(-static_cast<std::int64_t>(removed));
  outcome.remaining_dependencies = task->dependencies.size();

  if (options.cascade_removal) {
    outcome.cascade = cascade_remove(task_id, depends_on);
  }

  record(ChangeRecord{
      .action = ChangeAction::Remove,
      .task_id = task_id,
      .depends_on = depends_on,
      .reason = options.reason.empty() ? std::nullopt
                                       : std::optional<std::string>{options.reason},
      .forced = outcome.forced,
      .cascade_removal = options.cascade_removal,
      .cascade_results = outcome.cascade,
      .timestamp = format_timestamp(),
  });

  log::info("Removed dependency: {} -> {} ({} remaining, {} cascaded)",
            task_id, depends_on, outcome.remaining_dependencies,
            outcome.cascade.size());
  return outcome;
}

auto DependencyMutator::analyze_removal(const TaskId& task_id,
                                        const TaskId& depends_on) const
    -> MutationResult<RemovalImpact> {
  const auto* task = collection_.find(task_id);
  if (task == nullptr) {
    return make_error(Error::TaskNotFound, task_id, depends_on,
                      std::format("task '{}'", task_id));
  }
  // A dangling target has no attributes; only the structural checks apply.
  const auto* dependency = collection_.find(depends_on);

  TaskGraph graph(collection_);
  RemovalImpact impact;

  if (dependency != nullptr) {
    if ((task->status == TaskStatus::Pending ||
         task->status == TaskStatus::Blocked) &&
        dependency->status != TaskStatus::Completed) {
      impact.premature_unblock = true;
      impact.blocking_warnings.push_back(std::format(
          "Task \"{}\" may become unblocked before \"{}\" is completed",
          display_name(*task), display_name(*dependency)));
    }

    impact.logical_dependency =
        heuristics::infer_logical_dependency(*task, *dependency);
    if (impact.logical_dependency) {
      impact.advisories.push_back(*impact.logical_dependency);
    }

    if (heuristics::is_on_critical_path(graph, task_id) &&
        heuristics::is_on_critical_path(graph, depends_on)) {
      impact.affects_critical_path = true;
      impact.blocking_warnings.push_back(
          "Removal may affect the critical path");
    }

    impact.shared_skills = heuristics::shared_skills(*task, *dependency);
    if (!impact.shared_skills.empty()) {
      impact.advisories.push_back(
          "Tasks share common skills; resource allocation may need adjustment");
    }
  }

  for (const auto& dependent : graph.dependents(task_id)) {
    if (!Reachability::has_path_avoiding(graph, dependent, depends_on,
                                         task_id)) {
      impact.orphaned_tasks.push_back(dependent);
    }
  }
  if (!impact.orphaned_tasks.empty()) {
    impact.advisories.push_back(std::format(
        "{} tasks may lose their path to \"{}\"", impact.orphaned_tasks.size(),
        depends_on));
  }

  for (const auto& other : collection_.tasks) {
    if (other.id != task_id && other.depends_on(task_id) &&
        other.depends_on(depends_on)) {
      impact.cascade_candidates.push_back(other.id);
    }
  }
  if (!impact.cascade_candidates.empty()) {
    impact.advisories.push_back(std::format(
        "{} other dependencies may be affected",
        impact.cascade_candidates.size()));
  }

  return impact;
}

auto DependencyMutator::record(ChangeRecord record) -> void {
  if (change_log_ == nullptr) {
    return;
  }
  if (auto r = change_log_->append(record); !r) {
    log::warn("Failed to record {} of {} -> {}: {}",
              to_string_view(record.action), record.task_id, record.depends_on,
              r.error().message());
  }
}

auto DependencyMutator::cascade_remove(const TaskId& task_id,
                                       const TaskId& depends_on)
    -> std::vector<CascadeRemoval> {
  std::vector<CascadeRemoval> results;
  for (auto& other : collection_.tasks) {
    if (other.id == task_id || !other.depends_on(depends_on) ||
        !other.depends_on(task_id)) {
      continue;
    }
    auto removed = other.erase_dependency(depends_on);
    other.touch();
    collection_.adjust_dependency_count(-static_cast<std::int64_t>(removed));
    log::info("Cascade removal: {} no longer depends on {}", other.id,
              depends_on);
    results.push_back(CascadeRemoval{
        .task_id = other.id,
        .task_title = display_name(other),
        .removed_dependency = depends_on,
        .reason = "Redundant dependency removed",
    });
  }
  return results;
}

}  // namespace depgraph
