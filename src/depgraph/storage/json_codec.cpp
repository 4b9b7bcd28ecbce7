#include "depgraph/storage/json_codec.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace depgraph {

using json = nlohmann::json;

namespace {

[[nodiscard]] auto object_or_empty(const json& j) -> json {
  return j.is_object() ? j : json::object();
}

[[nodiscard]] auto all_strings(const json& j) -> bool {
  return std::ranges::all_of(j, [](const json& e) { return e.is_string(); });
}

[[nodiscard]] auto stats_from_json(const json& j) -> DependencyStats {
  DependencyStats stats;
  for (auto it = j.begin(); it != j.end(); ++it) {
    const auto& key = it.key();
    const auto& value = it.value();
    if (key == "totalDependencies" && value.is_number_integer()) {
      stats.total_dependencies = value.get<std::int64_t>();
      continue;
    }
    if (key == "lastUpdated" && value.is_string()) {
      stats.last_updated = value.get<std::string>();
      continue;
    }
    stats.extra[key] = value;
  }
  return stats;
}

}  // namespace

void to_json(json& j, const DetailedDependency& dep) {
  j = object_or_empty(dep.extra);
  j["taskId"] = dep.task_id;
  if (dep.type) j["type"] = *dep.type;
  if (dep.added_at) j["addedAt"] = *dep.added_at;
  if (dep.reason) j["reason"] = *dep.reason;
  if (dep.added_by) j["addedBy"] = *dep.added_by;
}

void from_json(const json& j, DetailedDependency& dep) {
  dep = DetailedDependency{};
  j.at("taskId").get_to(dep.task_id);
  for (auto it = j.begin(); it != j.end(); ++it) {
    const auto& key = it.key();
    const auto& value = it.value();
    if (key == "taskId") continue;
    if (value.is_string()) {
      if (key == "type") {
        dep.type = value.get<std::string>();
        continue;
      }
      if (key == "addedAt") {
        dep.added_at = value.get<std::string>();
        continue;
      }
      if (key == "reason") {
        dep.reason = value.get<std::string>();
        continue;
      }
      if (key == "addedBy") {
        dep.added_by = value.get<std::string>();
        continue;
      }
    }
    dep.extra[key] = value;
  }
}

void to_json(json& j, const Task& task) {
  j = object_or_empty(task.extra);
  j["id"] = task.id;
  if (task.title) j["title"] = *task.title;
  if (task.description) j["description"] = *task.description;
  if (task.status) j["status"] = std::string(to_string_view(*task.status));
  if (task.priority) j["priority"] = std::string(to_string_view(*task.priority));
  if (task.effort) j["effort"] = *task.effort;
  if (task.skills) j["skills"] = *task.skills;
  if (task.dependencies_present || !task.dependencies.empty()) {
    j["dependencies"] = task.dependencies;
  }
  if (task.detailed_dependencies) {
    j["detailed_dependencies"] = *task.detailed_dependencies;
  }
  if (task.updated_at) j["updated_at"] = *task.updated_at;
}

void from_json(const json& j, Task& task) {
  task = Task{};
  task.dependencies_present = false;
  j.at("id").get_to(task.id);
  for (auto it = j.begin(); it != j.end(); ++it) {
    const auto& key = it.key();
    const auto& value = it.value();
    if (key == "id") continue;

    if (key == "title" && value.is_string()) {
      task.title = value.get<std::string>();
      continue;
    }
    if (key == "description" && value.is_string()) {
      task.description = value.get<std::string>();
      continue;
    }
    if (key == "status" && value.is_string()) {
      if (auto status = parse_task_status(value.get_ref<const std::string&>())) {
        task.status = *status;
        continue;
      }
    }
    if (key == "priority" && value.is_string()) {
      if (auto priority =
              parse_task_priority(value.get_ref<const std::string&>())) {
        task.priority = *priority;
        continue;
      }
    }
    if (key == "effort" && value.is_number()) {
      task.effort = value.get<double>();
      continue;
    }
    if (key == "skills" && value.is_array() && all_strings(value)) {
      task.skills = value.get<std::vector<std::string>>();
      continue;
    }
    if (key == "dependencies" && value.is_array()) {
      value.get_to(task.dependencies);
      task.dependencies_present = true;
      continue;
    }
    if (key == "detailed_dependencies" && value.is_array()) {
      task.detailed_dependencies = value.get<std::vector<DetailedDependency>>();
      continue;
    }
    if (key == "updated_at" && value.is_string()) {
      task.updated_at = value.get<std::string>();
      continue;
    }
    task.extra[key] = value;
  }
}

void to_json(json& j, const TaskCollection& collection) {
  j = object_or_empty(collection.extra);

  const auto& meta = collection.metadata;
  auto meta_json = object_or_empty(meta.extra);
  if (meta.dependencies) {
    const auto& stats = *meta.dependencies;
    auto stats_json = object_or_empty(stats.extra);
    if (stats.total_dependencies) {
      stats_json["totalDependencies"] = *stats.total_dependencies;
    }
    if (stats.last_updated) stats_json["lastUpdated"] = *stats.last_updated;
    meta_json["dependencies"] = std::move(stats_json);
  }
  if (meta.use_detailed_dependencies) {
    meta_json["useDetailedDependencies"] = *meta.use_detailed_dependencies;
  }
  if (meta.present || !meta_json.empty()) {
    j["metadata"] = std::move(meta_json);
  }

  j["tasks"] = collection.tasks;
}

void from_json(const json& j, TaskCollection& collection) {
  collection = TaskCollection{};
  j.at("tasks").get_to(collection.tasks);

  for (auto it = j.begin(); it != j.end(); ++it) {
    if (it.key() == "tasks") continue;
    if (it.key() == "metadata" && it.value().is_object()) continue;
    collection.extra[it.key()] = it.value();
  }

  auto meta_it = j.find("metadata");
  if (meta_it == j.end() || !meta_it->is_object()) {
    return;
  }
  auto& meta = collection.metadata;
  meta.present = true;
  for (auto it = meta_it->begin(); it != meta_it->end(); ++it) {
    const auto& key = it.key();
    const auto& value = it.value();
    if (key == "dependencies" && value.is_object()) {
      meta.dependencies = stats_from_json(value);
      continue;
    }
    if (key == "useDetailedDependencies" && value.is_boolean()) {
      meta.use_detailed_dependencies = value.get<bool>();
      continue;
    }
    meta.extra[key] = value;
  }
}

void to_json(json& j, const CascadeRemoval& removal) {
  j = {
      {"taskId", removal.task_id},
      {"taskTitle", removal.task_title},
      {"removedDependency", removal.removed_dependency},
      {"reason", removal.reason},
  };
}

void to_json(json& j, const ChangeRecord& record) {
  j = {
      {"action", std::string(to_string_view(record.action))},
      {"taskId", record.task_id},
      {"dependsOn", record.depends_on},
  };
  if (record.type) j["type"] = *record.type;
  if (record.reason) j["reason"] = *record.reason;
  if (record.forced) j["forced"] = true;
  if (record.cascade_removal) j["cascadeRemoval"] = true;
  if (!record.cascade_results.empty()) {
    j["cascadeResults"] = record.cascade_results;
  }
  j["timestamp"] = record.timestamp;
}

void to_json(json& j, const MutationError& error) {
  j = {
      {"success", false},
      {"error", error.code.message()},
      {"message", error.message()},
      {"taskId", error.task_id},
      {"dependsOn", error.depends_on},
  };
  if (!error.cycle_path.empty()) j["cyclePath"] = error.cycle_path;
  if (!error.warnings.empty()) j["warnings"] = error.warnings;
}

void to_json(json& j, const ImpactSummary& impact) {
  j = {
      {"dependentCount", impact.dependent_count},
      {"chainSize", impact.chain_size},
      {"affectedCount", impact.affected_count},
      {"onCriticalPath", impact.on_critical_path},
  };
}

void to_json(json& j, const AddOutcome& outcome) {
  j = {
      {"success", true},
      {"alreadyExists", outcome.already_exists},
      {"taskDependencyCount", outcome.task_dependency_count},
  };
  if (outcome.already_exists) {
    return;
  }
  j["impact"] = outcome.impact;
  if (outcome.forced_cycle) {
    j["forcedCycle"] = true;
    j["cyclePath"] = outcome.cycle_path;
  }
  if (outcome.forced_type) j["forcedType"] = true;
  if (!outcome.warnings.empty()) j["warnings"] = outcome.warnings;
}

void to_json(json& j, const RemovalImpact& impact) {
  j = {
      {"blockingWarnings", impact.blocking_warnings},
      {"advisories", impact.advisories},
      {"prematureUnblock", impact.premature_unblock},
      {"orphanedTasks", impact.orphaned_tasks},
      {"affectsCriticalPath", impact.affects_critical_path},
      {"cascadeCandidates", impact.cascade_candidates},
      {"sharedSkills", impact.shared_skills},
  };
  if (impact.logical_dependency) {
    j["logicalDependency"] = *impact.logical_dependency;
  }
}

void to_json(json& j, const RemoveOutcome& outcome) {
  j = {
      {"success", true},
      {"existed", outcome.existed},
      {"originalDependencyCount", outcome.original_dependency_count},
      {"remainingDependencies", outcome.remaining_dependencies},
  };
  if (!outcome.existed) {
    return;
  }
  if (outcome.forced) j["forced"] = true;
  if (outcome.impact) j["impact"] = *outcome.impact;
  if (!outcome.cascade.empty()) j["cascadeResults"] = outcome.cascade;
}

void to_json(json& j, const Issue& issue) {
  j = {
      {"type", std::string(to_string_view(issue.type))},
      {"severity", std::string(to_string_view(issue.severity))},
      {"title", issue.title},
      {"description", issue.description},
      {"affectedTasks", issue.affected_tasks},
      {"suggestion", issue.suggestion},
      {"autoFixable", issue.auto_fixable()},
  };
  if (issue.fix) {
    j["autoFixAction"] = std::string(to_string_view(issue.fix->action));
    if (issue.type == IssueType::MissingDependency) {
      j["missingTaskId"] = issue.fix->target;
    }
  }
  if (!issue.path.empty()) {
    j[issue.type == IssueType::Cycle ? "cyclePath" : "redundancyPath"] =
        issue.path;
  }
}

void to_json(json& j, const AuditSummary& summary) {
  j = {
      {"totalTasks", summary.total_tasks},
      {"tasksWithDependencies", summary.tasks_with_dependencies},
      {"totalDependencies", summary.total_dependencies},
      {"cyclesFound", summary.cycles_found},
      {"orphanedTasks", summary.orphaned_tasks},
      {"redundantDependencies", summary.redundant_dependencies},
      {"missingReferences", summary.missing_references},
      {"critical", summary.critical},
      {"warning", summary.warning},
      {"info", summary.info},
  };
}

void to_json(json& j, const FixResult& fix) {
  j = {
      {"issueType", std::string(to_string_view(fix.issue_type))},
      {"applied", fix.applied},
      {"reason", fix.reason},
  };
  if (fix.action != FixAction::None) {
    j["action"] = std::string(to_string_view(fix.action));
    j["taskId"] = fix.task_id;
    j["target"] = fix.target;
  }
}

void to_json(json& j, const AuditReport& report) {
  j = {
      {"validationType", report.checks.to_string()},
      {"validatedAt", report.validated_at},
      {"issues", report.issues},
      {"summary", report.summary},
      {"fixes", report.fixes},
  };
  if (report.metrics) j["metrics"] = *report.metrics;
}

void to_json(json& j, const TaskImpact& impact) {
  j = {
      {"taskId", impact.id},
      {"directDependencies", impact.direct_dependencies},
      {"directDependents", impact.direct_dependents},
      {"totalImpact", impact.total_impact},
      {"impactScore", impact.impact_score},
      {"isCritical", impact.is_critical},
  };
}

void to_json(json& j, const DependencyMetrics& metrics) {
  auto distribution = json::object();
  for (const auto& [count, tasks] : metrics.dependency_distribution) {
    distribution[std::to_string(count)] = tasks;
  }
  j = {
      {"totalTasks", metrics.total_tasks},
      {"tasksWithDependencies", metrics.tasks_with_dependencies},
      {"totalDependencies", metrics.total_dependencies},
      {"averageDependenciesPerTask",
       std::round(metrics.average_dependencies_per_task * 100.0) / 100.0},
      {"maxDependencies", metrics.max_dependencies},
      {"tasksWithNoDependencies", metrics.tasks_with_no_dependencies},
      {"tasksWithNoDependents", metrics.tasks_with_no_dependents},
      {"longestDependencyChain", metrics.longest_dependency_chain},
      {"dependencyDistribution", std::move(distribution)},
  };
}

}  // namespace depgraph
