#include "depgraph/cli/commands.hpp"
#include "depgraph/cli/context.hpp"
#include "depgraph/graph/analysis.hpp"
#include "depgraph/graph/task_graph.hpp"
#include "depgraph/storage/json_codec.hpp"
#include "depgraph/storage/task_store.hpp"

#include <print>

namespace depgraph::cli {

auto cmd_subgraph(const SubgraphCommandOptions& opts) -> int {
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
  auto ids = extract_subgraph(graph, TaskId{opts.focus}, opts.max_depth);
  if (!ids) {
    std::println(stderr, "Error: Focus task not found: {}", opts.focus);
    return kExitError;
  }

  nlohmann::json tasks = nlohmann::json::array();
  for (const auto& id : *ids) {
    tasks.push_back(nlohmann::json(*graph.find(id)));
  }

  nlohmann::json out = {
      {"focusTask", opts.focus},
      {"maxDepth", opts.max_depth},
      {"taskCount", ids->size()},
      {"tasks", std::move(tasks)},
  };
  print_json(out);
  return kExitOk;
}

}  // namespace depgraph::cli
