#include "depgraph/cli/commands.hpp"
#include "depgraph/cli/context.hpp"
#include "depgraph/graph/analysis.hpp"
#include "depgraph/graph/task_graph.hpp"
#include "depgraph/storage/json_codec.hpp"
#include "depgraph/storage/task_store.hpp"

#include <algorithm>
#include <print>

namespace depgraph::cli {

auto cmd_impact(const ImpactCommandOptions& opts) -> int {
  auto ctx = load_context(opts.common);
  if (!ctx) {
    std::println(stderr, "Error: {}", ctx.error().message());
    return kExitError;
  }

  TaskStore store(ctx->tasks_file());
  auto collection = store.load();
  if (!collection) {
    std::println(stderr, "Error: {}: {}", store.path(),
                 collection.error().message());
    return kExitError;
  }

  TaskGraph graph(*collection);
  auto impacts = analyze_impact(graph);

  if (!opts.task_id.empty()) {
    TaskId id{opts.task_id};
    std::erase_if(impacts, [&id](const TaskImpact& i) { return i.id != id; });
    if (impacts.empty()) {
      std::println(stderr, "Error: Task not found: {}", opts.task_id);
      return kExitError;
    }
  }

  nlohmann::json out = {
      {"tasks", impacts},
      {"criticalTasks", rank_critical_tasks(graph)},
      {"highImpactTasks",
       std::ranges::count_if(impacts, &TaskImpact::is_critical)},
  };
  print_json(out);
  return kExitOk;
}

}  // namespace depgraph::cli
