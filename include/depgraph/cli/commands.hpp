#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace depgraph::cli {

// Exit codes shared by every command.
inline constexpr int kExitOk = 0;
inline constexpr int kExitError = 1;
inline constexpr int kExitRejected = 2;

struct CommonOptions {
  std::string config_file;
  // Overrides store.tasks_file / logging.level from the config when set.
  std::string tasks_file;
  std::string log_level;
};

struct AddCommandOptions {
  CommonOptions common;
  std::string task_id;
  std::string depends_on;
  std::string type{"blocking"};
  std::string reason;
  bool force{false};
  bool skip_cycle_check{false};
};

struct RemoveCommandOptions {
  CommonOptions common;
  std::string task_id;
  std::string depends_on;
  std::string reason;
  bool force{false};
  bool cascade{false};
  bool skip_impact{false};
};

struct ValidateCommandOptions {
  CommonOptions common;
  std::optional<std::string> checks;
  std::optional<std::string> min_severity;
  bool fix{false};
  bool metrics{false};
};

struct ImpactCommandOptions {
  CommonOptions common;
  std::string task_id;
};

struct SubgraphCommandOptions {
  CommonOptions common;
  std::string focus;
  std::size_t max_depth{0};
};

[[nodiscard]] auto cmd_add(const AddCommandOptions& opts) -> int;
[[nodiscard]] auto cmd_remove(const RemoveCommandOptions& opts) -> int;
[[nodiscard]] auto cmd_validate(const ValidateCommandOptions& opts) -> int;
[[nodiscard]] auto cmd_impact(const ImpactCommandOptions& opts) -> int;
[[nodiscard]] auto cmd_subgraph(const SubgraphCommandOptions& opts) -> int;

}  // namespace depgraph::cli
