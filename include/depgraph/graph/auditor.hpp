#pragma once

#include "depgraph/core/error.hpp"
#include "depgraph/graph/analysis.hpp"
#include "depgraph/graph/task.hpp"
#include "depgraph/graph/task_graph.hpp"
#include "depgraph/storage/change_log.hpp"
#include "depgraph/util/id.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace depgraph {

// Audit check selection. `full` is every check; names may be combined as a
// comma separated list ("cycles,redundant").
struct AuditChecks {
  bool cycles{true};
  bool logical{true};
  bool orphans{true};
  bool redundant{true};
  bool critical_path{true};

  [[nodiscard]] static constexpr auto full() noexcept -> AuditChecks {
    return {};
  }
  [[nodiscard]] static constexpr auto none() noexcept -> AuditChecks {
    return {false, false, false, false, false};
  }

  [[nodiscard]] auto is_full() const noexcept -> bool {
    return cycles && logical && orphans && redundant && critical_path;
  }

  [[nodiscard]] static auto parse(std::string_view names) -> Result<AuditChecks>;
  [[nodiscard]] auto to_string() const -> std::string;

  [[nodiscard]] friend auto operator==(const AuditChecks&, const AuditChecks&)
      -> bool = default;
};

enum class Severity : std::uint8_t { Info, Warning, Critical };

enum class IssueType : std::uint8_t {
  Cycle,
  MissingDependency,
  LogicalInconsistency,
  StatusInconsistency,
  PriorityInconsistency,
  OrphanedTask,
  RedundantDependency,
  Bottleneck,
  LongChain,
};

enum class FixAction : std::uint8_t { None, RemoveDependency, RaisePriority };

namespace detail {

constexpr std::array<std::string_view, 3> kSeverityNames = {
    "info", "warning", "critical",
};

constexpr std::array<std::string_view, 9> kIssueTypeNames = {
    "cycle",
    "missing-dependency",
    "logical-inconsistency",
    "status-inconsistency",
    "priority-inconsistency",
    "orphaned-task",
    "redundant-dependency",
    "bottleneck",
    "long-chain",
};

constexpr std::array<std::string_view, 3> kFixActionNames = {
    "none", "remove-dependency", "raise-priority",
};

}  // namespace detail

[[nodiscard]] constexpr auto to_string_view(Severity s) noexcept
    -> std::string_view {
  return detail::kSeverityNames[static_cast<std::size_t>(s)];
}

[[nodiscard]] constexpr auto to_string_view(IssueType t) noexcept
    -> std::string_view {
  return detail::kIssueTypeNames[static_cast<std::size_t>(t)];
}

[[nodiscard]] constexpr auto to_string_view(FixAction a) noexcept
    -> std::string_view {
  return detail::kFixActionNames[static_cast<std::size_t>(a)];
}

[[nodiscard]] auto parse_severity(std::string_view name) noexcept
    -> std::optional<Severity>;

// What an auto-fix does. RemoveDependency drops `task_id -> target`;
// RaisePriority bumps `target` one priority level.
struct IssueFix {
  FixAction action{FixAction::None};
  TaskId task_id;
  TaskId target;
};

struct Issue {
  IssueType type{IssueType::Cycle};
  Severity severity{Severity::Info};
  std::string title;
  std::string description;
  std::vector<TaskId> affected_tasks;
  std::string suggestion;
  // Cycle or redundancy path, when the issue has one.
  std::vector<TaskId> path;
  std::optional<IssueFix> fix;

  [[nodiscard]] auto auto_fixable() const noexcept -> bool {
    return fix.has_value();
  }
};

struct AuditSummary {
  std::size_t total_tasks{0};
  std::size_t tasks_with_dependencies{0};
  std::size_t total_dependencies{0};
  std::size_t cycles_found{0};
  std::size_t orphaned_tasks{0};
  std::size_t redundant_dependencies{0};
  std::size_t missing_references{0};
  std::size_t critical{0};
  std::size_t warning{0};
  std::size_t info{0};
};

struct FixResult {
  IssueType issue_type{IssueType::Cycle};
  FixAction action{FixAction::None};
  TaskId task_id;
  TaskId target;
  bool applied{false};
  std::string reason;
};

struct AuditOptions {
  AuditChecks checks{AuditChecks::full()};
  Severity min_severity{Severity::Info};
  std::size_t bottleneck_threshold{3};
  std::size_t long_chain_threshold{5};
  bool include_metrics{false};
};

struct AuditReport {
  std::vector<Issue> issues;
  AuditSummary summary;
  std::vector<FixResult> fixes;
  std::optional<DependencyMetrics> metrics;
  AuditChecks checks;
  std::string validated_at;

  [[nodiscard]] auto has_critical() const noexcept -> bool {
    return summary.critical > 0;
  }
  [[nodiscard]] auto count(IssueType type) const -> std::size_t;
};

// Full-graph integrity audit. `audit` never mutates; `audit_and_fix`
// applies every auto-fixable issue it finds to the collection and reports
// the state after the fixes.
class DependencyAuditor {
public:
  explicit DependencyAuditor(AuditOptions options = {},
                             ChangeLogSink* change_log = nullptr);

  [[nodiscard]] auto audit(const TaskCollection& collection) const
      -> AuditReport;

  [[nodiscard]] auto audit_and_fix(TaskCollection& collection) -> AuditReport;

  [[nodiscard]] auto options() const noexcept -> const AuditOptions& {
    return options_;
  }

private:
  auto check_cycles(const TaskGraph& graph, AuditReport& report) const -> void;
  auto check_logical(const TaskGraph& graph, AuditReport& report) const
      -> void;
  auto check_orphans(const TaskGraph& graph, AuditReport& report) const
      -> void;
  auto check_redundancy(const TaskGraph& graph, AuditReport& report) const
      -> void;
  auto check_critical_path(const TaskGraph& graph, AuditReport& report) const
      -> void;

  auto apply_fix(TaskCollection& collection, const Issue& issue) -> FixResult;

  AuditOptions options_;
  ChangeLogSink* change_log_;
};

}  // namespace depgraph
