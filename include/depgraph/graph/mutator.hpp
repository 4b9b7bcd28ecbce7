#pragma once

#include "depgraph/core/error.hpp"
#include "depgraph/graph/task.hpp"
#include "depgraph/storage/change_log.hpp"
#include "depgraph/util/id.hpp"

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace depgraph {

// Structured failure of a mutation. `code` compares equal to the matching
// Error value (Error::CircularDependency, ...), so callers branch without
// parsing strings.
struct MutationError {
  std::error_code code;
  TaskId task_id;
  TaskId depends_on;
  std::vector<TaskId> cycle_path;
  std::string reason;
  std::vector<std::string> warnings;

  [[nodiscard]] auto message() const -> std::string;
};

template <typename T>
using MutationResult = std::expected<T, MutationError>;

struct AddOptions {
  std::string type{kDefaultDependencyType};
  std::string reason;
  bool force{false};
  bool validate_cycles{true};
  std::string added_by{"depgraph"};
};

struct ImpactSummary {
  // Tasks that depend on the task gaining the dependency.
  std::size_t dependent_count{0};
  // Distinct tasks in the new dependency's own chain.
  std::size_t chain_size{0};
  std::size_t affected_count{0};
  bool on_critical_path{false};
};

struct AddOutcome {
  bool already_exists{false};
  bool forced_cycle{false};
  bool forced_type{false};
  std::vector<TaskId> cycle_path;
  std::vector<std::string> warnings;
  ImpactSummary impact;
  std::size_t task_dependency_count{0};
};

struct RemoveOptions {
  bool force{false};
  bool cascade_removal{false};
  bool analyze_impact{true};
  std::string reason;
};

struct RemovalImpact {
  // Warnings that block an unforced removal.
  std::vector<std::string> blocking_warnings;
  // Non-fatal findings.
  std::vector<std::string> advisories;
  bool premature_unblock{false};
  std::optional<std::string> logical_dependency;
  std::vector<TaskId> orphaned_tasks;
  bool affects_critical_path{false};
  std::vector<TaskId> cascade_candidates;
  std::vector<std::string> shared_skills;

  [[nodiscard]] auto has_blocking_warnings() const noexcept -> bool {
    return !blocking_warnings.empty();
  }
};

struct RemoveOutcome {
  bool existed{true};
  bool forced{false};
  std::optional<RemovalImpact> impact;
  std::vector<CascadeRemoval> cascade;
  std::size_t original_dependency_count{0};
  std::size_t remaining_dependencies{0};
};

// Single-edge mutations on a caller-owned collection. Every failure leaves
// the collection unchanged; a graph view is rebuilt per call.
class DependencyMutator {
public:
  explicit DependencyMutator(TaskCollection& collection,
                             ChangeLogSink* change_log = nullptr);

  [[nodiscard]] auto add_dependency(const TaskId& task_id,
                                    const TaskId& depends_on,
                                    const AddOptions& options = {})
      -> MutationResult<AddOutcome>;

  [[nodiscard]] auto remove_dependency(const TaskId& task_id,
                                       const TaskId& depends_on,
                                       const RemoveOptions& options = {})
      -> MutationResult<RemoveOutcome>;

  // Removal analysis without mutating anything.
  [[nodiscard]] auto analyze_removal(const TaskId& task_id,
                                     const TaskId& depends_on) const
      -> MutationResult<RemovalImpact>;

private:
  auto record(ChangeRecord record) -> void;
  auto cascade_remove(const TaskId& task_id, const TaskId& depends_on)
      -> std::vector<CascadeRemoval>;

  TaskCollection& collection_;
  ChangeLogSink* change_log_;
};

}  // namespace depgraph
