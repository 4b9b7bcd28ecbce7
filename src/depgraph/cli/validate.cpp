#include "depgraph/cli/commands.hpp"
#include "depgraph/cli/context.hpp"
#include "depgraph/graph/auditor.hpp"
#include "depgraph/storage/json_codec.hpp"
#include "depgraph/storage/task_store.hpp"

#include <algorithm>
#include <print>

namespace depgraph::cli {

auto cmd_validate(const ValidateCommandOptions& opts) -> int {
  auto ctx = load_context(opts.common);
  if (!ctx) {
    std::println(stderr, "Error: {}", ctx.error().message());
    return kExitError;
  }

  auto options = ctx->audit_options(opts);
  if (!options) {
    std::println(stderr, "Error: {}", options.error().message());
    return kExitError;
  }

  // Only a fixing audit writes the store back.
  std::optional<StoreLock> lock;
  if (opts.fix) {
    auto acquired = ctx->lock_store();
    if (!acquired) {
      std::println(stderr, "Error: {}", acquired.error().message());
      return kExitError;
    }
    lock = std::move(*acquired);
  }

  TaskStore store(ctx->tasks_file());
  auto collection = store.load();
  if (!collection) {
    std::println(stderr, "Error: {}: {}", store.path(),
                 collection.error().message());
    return kExitError;
  }

  PendingChangeLog change_log(ctx->make_change_log());
  DependencyAuditor auditor(*options, &change_log);

  AuditReport report;
  if (opts.fix) {
    report = auditor.audit_and_fix(*collection);
    if (std::ranges::any_of(report.fixes, &FixResult::applied)) {
      if (auto r = store.save(*collection); !r) {
        std::println(stderr, "Error: {}: {}", store.path(),
                     r.error().message());
        return kExitError;
      }
      commit_change_log(change_log);
    }
  } else {
    report = auditor.audit(*collection);
  }

  print_json(report);
  return report.has_critical() ? kExitRejected : kExitOk;
}

}  // namespace depgraph::cli
