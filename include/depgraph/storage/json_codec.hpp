#pragma once

#include "depgraph/graph/analysis.hpp"
#include "depgraph/graph/auditor.hpp"
#include "depgraph/graph/mutator.hpp"
#include "depgraph/graph/task.hpp"
#include "depgraph/storage/change_log.hpp"
#include "depgraph/util/id.hpp"

#include <nlohmann/json.hpp>

namespace depgraph {

// Ids are JSON strings; numeric ids are accepted on input and read as their
// decimal text.
template <typename Tag>
void to_json(nlohmann::json& j, const TypedId<Tag>& id) {
  j = id.str();
}

template <typename Tag>
void from_json(const nlohmann::json& j, TypedId<Tag>& id) {
  if (j.is_number_integer()) {
    id = TypedId<Tag>{j.dump()};
    return;
  }
  id = TypedId<Tag>{j.get<std::string>()};
}

// Task collection documents. Unknown keys at every level land in `extra`
// and are written back unchanged; typed fields win over `extra` on output.
void to_json(nlohmann::json& j, const DetailedDependency& dep);
void from_json(const nlohmann::json& j, DetailedDependency& dep);

void to_json(nlohmann::json& j, const Task& task);
void from_json(const nlohmann::json& j, Task& task);

void to_json(nlohmann::json& j, const TaskCollection& collection);
void from_json(const nlohmann::json& j, TaskCollection& collection);

// Change-log lines.
void to_json(nlohmann::json& j, const CascadeRemoval& removal);
void to_json(nlohmann::json& j, const ChangeRecord& record);

// Result structures, output only.
void to_json(nlohmann::json& j, const MutationError& error);
void to_json(nlohmann::json& j, const ImpactSummary& impact);
void to_json(nlohmann::json& j, const AddOutcome& outcome);
void to_json(nlohmann::json& j, const RemovalImpact& impact);
void to_json(nlohmann::json& j, const RemoveOutcome& outcome);

void to_json(nlohmann::json& j, const Issue& issue);
void to_json(nlohmann::json& j, const AuditSummary& summary);
void to_json(nlohmann::json& j, const FixResult& fix);
void to_json(nlohmann::json& j, const AuditReport& report);

void to_json(nlohmann::json& j, const TaskImpact& impact);
void to_json(nlohmann::json& j, const DependencyMetrics& metrics);

}  // namespace depgraph
