#include "depgraph/graph/auditor.hpp"

#include "depgraph/graph/cycle_detector.hpp"
#include "depgraph/graph/heuristics.hpp"
#include "depgraph/graph/reachability.hpp"
#include "depgraph/util/log.hpp"
#include "depgraph/util/util.hpp"

#include <algorithm>
#include <format>
#include <ranges>
#include <unordered_set>
#include <utility>

namespace depgraph {

namespace {

[[nodiscard]] auto trim(std::string_view s) -> std::string_view {
  auto first = s.find_first_not_of(" \t");
  if (first == std::string_view::npos) {
    return {};
  }
  auto last = s.find_last_not_of(" \t");
  return s.substr(first, last - first + 1);
}

[[nodiscard]] auto status_name(const Task& task) -> std::string_view {
  return task.status ? to_string_view(*task.status) : std::string_view{"unset"};
}

[[nodiscard]] auto title_or_id(const Task& task) -> const std::string& {
  return task.title && !task.title->empty() ? *task.title : task.id.str();
}

}  // namespace

auto AuditChecks::parse(std::string_view names) -> Result<AuditChecks> {
  auto checks = AuditChecks::none();
  bool any = false;
  for (auto part : names | std::views::split(',')) {
    auto name = trim(std::string_view(part.begin(), part.end()));
    if (name.empty()) {
      continue;
    }
    if (name == "full") {
      checks = AuditChecks::full();
    } else if (name == "cycles") {
      checks.cycles = true;
    } else if (name == "logical") {
      checks.logical = true;
    } else if (name == "orphans") {
      checks.orphans = true;
    } else if (name == "redundant") {
      checks.redundant = true;
    } else if (name == "critical-path") {
      checks.critical_path = true;
    } else {
      log::error("Unknown audit check: {}", name);
      return fail(Error::InvalidArgument);
    }
    any = true;
  }
  if (!any) {
    log::error("No audit checks selected");
    return fail(Error::InvalidArgument);
  }
  return checks;
}

auto AuditChecks::to_string() const -> std::string {
  if (is_full()) {
    return "full";
  }
  std::string out;
  auto append = [&out](bool enabled, std::string_view name) {
    if (!enabled) return;
    if (!out.empty()) out += ',';
    out += name;
  };
  append(cycles, "cycles");
  append(logical, "logical");
  append(orphans, "orphans");
  append(redundant, "redundant");
  append(critical_path, "critical-path");
  return out;
}

auto parse_severity(std::string_view name) noexcept -> std::optional<Severity> {
  if (name == "all") {
    return Severity::Info;
  }
  auto it = std::ranges::find(detail::kSeverityNames, name);
  if (it == detail::kSeverityNames.end()) {
    return std::nullopt;
  }
  return static_cast<Severity>(
      std::ranges::distance(detail::kSeverityNames.begin(), it));
}

auto AuditReport::count(IssueType type) const -> std::size_t {
  return static_cast<std::size_t>(
      std::ranges::count(issues, type, &Issue::type));
}

DependencyAuditor::DependencyAuditor(AuditOptions options,
                                     ChangeLogSink* change_log)
    : options_(std::move(options)), change_log_(change_log) {}

auto DependencyAuditor::audit(const TaskCollection& collection) const
    -> AuditReport {
  TaskGraph graph(collection);

  AuditReport report;
  report.checks = options_.checks;
  report.validated_at = format_timestamp();
  report.summary.total_tasks = collection.tasks.size();
  for (const auto& task : collection.tasks) {
    if (!task.dependencies.empty()) {
      ++report.summary.tasks_with_dependencies;
      report.summary.total_dependencies += task.dependencies.size();
    }
  }

  if (options_.checks.cycles) check_cycles(graph, report);
  if (options_.checks.logical) check_logical(graph, report);
  if (options_.checks.orphans) check_orphans(graph, report);
  if (options_.checks.redundant) check_redundancy(graph, report);
  if (options_.checks.critical_path) check_critical_path(graph, report);

  std::erase_if(report.issues, [this](const Issue& issue) {
    return issue.severity < options_.min_severity;
  });
  for (const auto& issue : report.issues) {
    switch (issue.severity) {
      case Severity::Critical:
        ++report.summary.critical;
        break;
      case Severity::Warning:
        ++report.summary.warning;
        break;
      case Severity::Info:
        ++report.summary.info;
        break;
    }
  }

  if (options_.include_metrics) {
    report.metrics = compute_metrics(graph);
  }

  log::debug("Audit ({}) of {} tasks: {} critical, {} warning, {} info",
             options_.checks.to_string(), report.summary.total_tasks,
             report.summary.critical, report.summary.warning,
             report.summary.info);
  return report;
}

auto DependencyAuditor::audit_and_fix(TaskCollection& collection)
    -> AuditReport {
  auto report = audit(collection);

  std::vector<FixResult> fixes;
  bool applied_any = false;
  for (const auto& issue : report.issues) {
    if (!issue.fix) {
      fixes.push_back(FixResult{
          .issue_type = issue.type,
          .applied = false,
          .reason = "Issue is not auto-fixable",
      });
      continue;
    }
    auto result = apply_fix(collection, issue);
    applied_any = applied_any || result.applied;
    fixes.push_back(std::move(result));
  }

  if (!applied_any) {
    report.fixes = std::move(fixes);
    return report;
  }

  auto after = audit(collection);
  after.fixes = std::move(fixes);
  log::info("Audit auto-fix applied {} fix(es), {} issue(s) remain",
            std::ranges::count(after.fixes, true, &FixResult::applied),
            after.issues.size());
  return after;
}

auto DependencyAuditor::check_cycles(const TaskGraph& graph,
                                     AuditReport& report) const -> void {
  auto cycles = CycleDetector::find_all_cycles(graph);
  report.summary.cycles_found = cycles.size();
  for (auto& cycle : cycles) {
    Issue issue{
        .type = IssueType::Cycle,
        .severity = Severity::Critical,
        .title = "Circular Dependency Detected",
        .description = std::format(
            "Circular dependency found in task chain: {}", join_path(cycle)),
        .suggestion = "Remove one or more dependencies to break the cycle",
    };
    issue.affected_tasks.assign(cycle.begin(),
                                cycle.empty() ? cycle.end() : cycle.end() - 1);
    issue.path = std::move(cycle);
    report.issues.push_back(std::move(issue));
  }
}

auto DependencyAuditor::check_logical(const TaskGraph& graph,
                                      AuditReport& report) const -> void {
  for (NodeIndex idx = 0; idx < graph.size(); ++idx) {
    const auto& task = graph.task(idx);
    std::unordered_set<TaskId> seen;

    for (const auto& dep_id : graph.raw_deps(idx)) {
      if (!seen.insert(dep_id).second) {
        continue;
      }
      const auto* dep = graph.find(dep_id);
      if (dep == nullptr) {
        ++report.summary.missing_references;
        report.issues.push_back(Issue{
            .type = IssueType::MissingDependency,
            .severity = Severity::Critical,
            .title = "Missing Dependency Task",
            .description =
                std::format("Task \"{}\" depends on non-existent task: {}",
                            title_or_id(task), dep_id),
            .affected_tasks = {task.id},
            .suggestion = "Remove the dependency or create the missing task",
            .fix = IssueFix{FixAction::RemoveDependency, task.id, dep_id},
        });
        continue;
      }

      if (heuristics::is_testing_task(task) &&
          heuristics::is_implementation_task(*dep)) {
        report.issues.push_back(Issue{
            .type = IssueType::LogicalInconsistency,
            .severity = Severity::Warning,
            .title = "Questionable Dependency Order",
            .description = std::format(
                "Testing task \"{}\" depends on implementation task \"{}\" - "
                "this may be backwards",
                title_or_id(task), title_or_id(*dep)),
            .affected_tasks = {task.id, dep->id},
            .suggestion = "Consider if the implementation should depend on "
                          "the test specification instead",
        });
      }

      if (heuristics::is_implementation_task(task) &&
          heuristics::is_setup_task(*dep) &&
          task.status == TaskStatus::Completed &&
          dep->status == TaskStatus::Pending) {
        report.issues.push_back(Issue{
            .type = IssueType::LogicalInconsistency,
            .severity = Severity::Warning,
            .title = "Implementation Completed Before Setup",
            .description = std::format(
                "Implementation task \"{}\" is completed but setup dependency "
                "\"{}\" is still pending",
                title_or_id(task), title_or_id(*dep)),
            .affected_tasks = {task.id, dep->id},
            .suggestion = "Verify if the setup was actually completed and "
                          "update task status",
        });
      }

      if (task.status == TaskStatus::Completed &&
          dep->status != TaskStatus::Completed &&
          dep->status != TaskStatus::Cancelled) {
        report.issues.push_back(Issue{
            .type = IssueType::StatusInconsistency,
            .severity = Severity::Warning,
            .title = "Completed Task with Incomplete Dependency",
            .description = std::format(
                "Task \"{}\" is completed but dependency \"{}\" is {}",
                title_or_id(task), title_or_id(*dep), status_name(*dep)),
            .affected_tasks = {task.id, dep->id},
            .suggestion = "Verify task completion or update dependency status",
        });
      }

      if (task.status == TaskStatus::InProgress &&
          dep->status == TaskStatus::Pending) {
        report.issues.push_back(Issue{
            .type = IssueType::StatusInconsistency,
            .severity = Severity::Info,
            .title = "Task Started Before Dependency",
            .description = std::format(
                "Task \"{}\" is in progress but dependency \"{}\" is still "
                "pending",
                title_or_id(task), title_or_id(*dep)),
            .affected_tasks = {task.id, dep->id},
            .suggestion = "Consider starting the dependency task if this is a "
                          "blocking relationship",
        });
      }

      if (task.priority == TaskPriority::High &&
          dep->priority == TaskPriority::Low) {
        report.issues.push_back(Issue{
            .type = IssueType::PriorityInconsistency,
            .severity = Severity::Info,
            .title = "Priority Mismatch",
            .description = std::format(
                "High priority task \"{}\" depends on low priority task \"{}\"",
                title_or_id(task), title_or_id(*dep)),
            .affected_tasks = {task.id, dep->id},
            .suggestion = "Consider increasing dependency priority or "
                          "reviewing task priorities",
            .fix = IssueFix{FixAction::RaisePriority, task.id, dep->id},
        });
      }
    }
  }
}

auto DependencyAuditor::check_orphans(const TaskGraph& graph,
                                      AuditReport& report) const -> void {
  for (NodeIndex idx = 0; idx < graph.size(); ++idx) {
    if (!graph.raw_deps(idx).empty() || !graph.dependents_view(idx).empty()) {
      continue;
    }
    const auto& task = graph.task(idx);
    ++report.summary.orphaned_tasks;
    report.issues.push_back(Issue{
        .type = IssueType::OrphanedTask,
        .severity = Severity::Info,
        .title = "Orphaned Task",
        .description = std::format(
            "Task \"{}\" has no dependencies and no other tasks depend on it",
            title_or_id(task)),
        .affected_tasks = {task.id},
        .suggestion = "Review if this task needs dependencies or if other "
                      "tasks should depend on it",
    });
  }
}

auto DependencyAuditor::check_redundancy(const TaskGraph& graph,
                                         AuditReport& report) const -> void {
  for (NodeIndex idx = 0; idx < graph.size(); ++idx) {
    const auto& task = graph.task(idx);
    if (task.dependencies.size() < 2) {
      continue;
    }
    std::unordered_set<TaskId> seen;
    for (const auto& dep_id : graph.raw_deps(idx)) {
      if (!seen.insert(dep_id).second) {
        continue;
      }
      auto path = Reachability::find_indirect_path(graph, task.id, dep_id);
      if (path.empty()) {
        continue;
      }
      const auto* dep = graph.find(dep_id);
      ++report.summary.redundant_dependencies;
      report.issues.push_back(Issue{
          .type = IssueType::RedundantDependency,
          .severity = Severity::Info,
          .title = "Redundant Dependency",
          .description = std::format(
              "Task \"{}\" has redundant dependency on \"{}\" via path: {}",
              title_or_id(task), dep ? title_or_id(*dep) : dep_id.str(),
              join_path(path)),
          .affected_tasks = {task.id, dep_id},
          .suggestion = "Consider removing the direct dependency as an "
                        "indirect path exists",
          .path = std::move(path),
          .fix = IssueFix{FixAction::RemoveDependency, task.id, dep_id},
      });
    }
  }
}

auto DependencyAuditor::check_critical_path(const TaskGraph& graph,
                                            AuditReport& report) const
    -> void {
  for (NodeIndex idx = 0; idx < graph.size(); ++idx) {
    const auto& task = graph.task(idx);
    auto dependents = graph.dependents(task.id).size();
    if (dependents >= options_.bottleneck_threshold) {
      report.issues.push_back(Issue{
          .type = IssueType::Bottleneck,
          .severity = Severity::Warning,
          .title = "Potential Bottleneck",
          .description = std::format(
              "Task \"{}\" has {} dependent tasks, creating a potential "
              "bottleneck",
              title_or_id(task), dependents),
          .affected_tasks = {task.id},
          .suggestion = "Consider parallelizing some dependent tasks or "
                        "breaking down this task",
      });
    }
  }

  auto chains = Reachability::all_chain_lengths(graph);
  for (NodeIndex idx = 0; idx < graph.size(); ++idx) {
    if (chains[idx] < options_.long_chain_threshold) {
      continue;
    }
    const auto& task = graph.task(idx);
    report.issues.push_back(Issue{
        .type = IssueType::LongChain,
        .severity = Severity::Info,
        .title = "Long Dependency Chain",
        .description =
            std::format("Task \"{}\" has a dependency chain of {} tasks",
                        title_or_id(task), chains[idx]),
        .affected_tasks = {task.id},
        .suggestion = "Review if some dependencies can be parallelized",
    });
  }
}

auto DependencyAuditor::apply_fix(TaskCollection& collection,
                                  const Issue& issue) -> FixResult {
  const auto& fix = *issue.fix;
  FixResult result{
      .issue_type = issue.type,
      .action = fix.action,
      .task_id = fix.task_id,
      .target = fix.target,
  };

  if (fix.action == FixAction::RaisePriority) {
    auto* target = collection.find(fix.target);
    if (target == nullptr || target->priority != TaskPriority::Low) {
      result.reason = "Dependency priority is no longer low";
      return result;
    }
    target->priority = TaskPriority::Medium;
    target->touch();
    log::info("Auto-fix: raised priority of {} to medium", fix.target);
    result.applied = true;
    result.reason = "Auto-fix applied successfully";
    return result;
  }

  auto* task = collection.find(fix.task_id);
  if (task == nullptr || !task->depends_on(fix.target)) {
    result.reason = "Dependency no longer exists";
    return result;
  }
  // Earlier fixes in the same pass may have changed the graph.
  if (issue.type == IssueType::MissingDependency &&
      collection.find(fix.target) != nullptr) {
    result.reason = "Dependency target now exists";
    return result;
  }
  if (issue.type == IssueType::RedundantDependency) {
    TaskGraph graph(collection);
    if (Reachability::find_indirect_path(graph, fix.task_id, fix.target)
            .empty()) {
      result.reason = "Dependency is no longer redundant";
      return result;
    }
  }

  auto removed = task->erase_dependency(fix.target);
  task->touch();
  collection.adjust_dependency_count(-static_cast<std::int64_t>(removed));
  log::info("Auto-fix: removed {} dependency {} -> {}",
            to_string_view(issue.type), fix.task_id, fix.target);

  if (change_log_ != nullptr) {
    auto record = ChangeRecord{
        .action = ChangeAction::Remove,
        .task_id = fix.task_id,
        .depends_on = fix.target,
        .reason = std::format("auto-fix: {}", to_string_view(issue.type)),
        .timestamp = format_timestamp(),
    };
    if (auto r = change_log_->append(record); !r) {
      log::warn("Failed to record auto-fix of {} -> {}: {}", fix.task_id,
                fix.target, r.error().message());
    }
  }

  result.applied = true;
  result.reason = "Auto-fix applied successfully";
  return result;
}

}  // namespace depgraph
