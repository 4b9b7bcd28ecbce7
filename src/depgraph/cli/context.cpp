#include "depgraph/cli/context.hpp"

#include "depgraph/config/config.hpp"
#include "depgraph/util/log.hpp"

#include <print>

namespace depgraph::cli {

auto load_context(const CommonOptions& common) -> Result<CommandContext> {
  CommandContext ctx;
  if (!common.config_file.empty()) {
    auto config = ConfigLoader::load_from_file(common.config_file);
    if (!config) {
      return fail(config.error());
    }
    ctx.config = std::move(*config);
  }

  if (!common.tasks_file.empty()) {
    ctx.config.store.tasks_file = common.tasks_file;
  }
  if (!common.log_level.empty()) {
    ctx.config.logging.level = common.log_level;
  }

  log::set_level(ctx.config.logging.level);
  if (!ctx.config.logging.file.empty() &&
      !log::set_file(ctx.config.logging.file)) {
    log::warn("Cannot open log file {}, logging to stderr only",
              ctx.config.logging.file);
  }
  return ctx;
}

auto CommandContext::lock_store() const -> Result<std::optional<StoreLock>> {
  if (!config.store.use_lock) {
    return std::optional<StoreLock>{};
  }
  auto lock = StoreLock::acquire(config.store.tasks_file);
  if (!lock) {
    return fail(lock.error());
  }
  return std::optional<StoreLock>{std::move(*lock)};
}

auto CommandContext::make_change_log() const -> std::unique_ptr<ChangeLogSink> {
  if (config.store.change_log.empty()) {
    return nullptr;
  }
  return std::make_unique<JsonLinesChangeLog>(config.store.change_log);
}

auto CommandContext::audit_options(const ValidateCommandOptions& opts) const
    -> Result<AuditOptions> {
  AuditOptions options;

  auto checks = AuditChecks::parse(opts.checks.value_or(config.audit.checks));
  if (!checks) {
    return fail(checks.error());
  }
  options.checks = *checks;

  auto severity_name = opts.min_severity.value_or(config.audit.min_severity);
  auto severity = parse_severity(severity_name);
  if (!severity) {
    log::error("Unknown severity: {}", severity_name);
    return fail(Error::InvalidArgument);
  }
  options.min_severity = *severity;

  options.bottleneck_threshold = config.audit.bottleneck_threshold;
  options.long_chain_threshold = config.audit.long_chain_threshold;
  options.include_metrics = opts.metrics || config.audit.include_metrics;
  return options;
}

auto print_json(const nlohmann::json& j) -> void {
  std::println("{}", j.dump(2));
}

auto commit_change_log(PendingChangeLog& change_log) -> void {
  auto pending = change_log.pending();
  if (auto r = change_log.commit(); !r) {
    log::warn("Failed to write change log ({} of {} records pending): {}",
              change_log.pending(), pending, r.error().message());
  }
}

}  // namespace depgraph::cli
