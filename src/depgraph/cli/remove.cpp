#include "depgraph/cli/commands.hpp"
#include "depgraph/cli/context.hpp"
#include "depgraph/graph/mutator.hpp"
#include "depgraph/storage/json_codec.hpp"
#include "depgraph/storage/task_store.hpp"

#include <print>

namespace depgraph::cli {

auto cmd_remove(const RemoveCommandOptions& opts) -> int {
  auto ctx = load_context(opts.common);
  if (!ctx) {
    std::println(stderr, "Error: {}", ctx.error().message());
    return kExitError;
  }

  auto lock = ctx->lock_store();
  if (!lock) {
    std::println(stderr, "Error: {}", lock.error().message());
    return kExitError;
  }

  TaskStore store(ctx->tasks_file());
  auto collection = store.load();
  if (!collection) {
    std::println(stderr, "Error: {}: {}", store.path(),
                 collection.error().message());
    return kExitError;
  }

  PendingChangeLog change_log(ctx->make_change_log());
  DependencyMutator mutator(*collection, &change_log);

  RemoveOptions options{
      .force = opts.force,
      .cascade_removal = opts.cascade || ctx->config.mutation.cascade_removal,
      .analyze_impact =
          ctx->config.mutation.analyze_impact && !opts.skip_impact,
      .reason = opts.reason,
  };
  auto result = mutator.remove_dependency(TaskId{opts.task_id},
                                          TaskId{opts.depends_on}, options);
  if (!result) {
    print_json(result.error());
    return kExitRejected;
  }

  if (result->existed) {
    if (auto r = store.save(*collection); !r) {
      std::println(stderr, "Error: {}: {}", store.path(), r.error().message());
      return kExitError;
    }
    commit_change_log(change_log);
  }

  print_json(*result);
  return kExitOk;
}

}  // namespace depgraph::cli
