#pragma once

#include "depgraph/cli/commands.hpp"
#include "depgraph/config/engine_config.hpp"
#include "depgraph/core/error.hpp"
#include "depgraph/graph/auditor.hpp"
#include "depgraph/storage/change_log.hpp"
#include "depgraph/storage/store_lock.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>

namespace depgraph::cli {

// Configuration resolved for one command: config file, then command-line
// overrides. Loading it also applies the logging settings.
struct CommandContext {
  EngineConfig config;

  [[nodiscard]] auto tasks_file() const -> const std::string& {
    return config.store.tasks_file;
  }

  // Lock for a load-mutate-save cycle; nullopt when locking is disabled.
  [[nodiscard]] auto lock_store() const -> Result<std::optional<StoreLock>>;

  // JSON-lines change log when one is configured. Commands wrap it in a
  // PendingChangeLog and commit after the task file is saved.
  [[nodiscard]] auto make_change_log() const
      -> std::unique_ptr<ChangeLogSink>;

  [[nodiscard]] auto audit_options(const ValidateCommandOptions& opts) const
      -> Result<AuditOptions>;
};

[[nodiscard]] auto load_context(const CommonOptions& common)
    -> Result<CommandContext>;

auto print_json(const nlohmann::json& j) -> void;

// The task file is already saved; a failed write is only warned about.
auto commit_change_log(PendingChangeLog& change_log) -> void;

}  // namespace depgraph::cli
