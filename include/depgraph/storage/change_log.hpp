#pragma once

#include "depgraph/core/error.hpp"
#include "depgraph/util/id.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace depgraph {

enum class ChangeAction : std::uint8_t { Add, Remove };

[[nodiscard]] constexpr auto to_string_view(ChangeAction action) noexcept
    -> std::string_view {
  return action == ChangeAction::Add ? "add" : "remove";
}

struct CascadeRemoval {
  TaskId task_id;
  std::string task_title;
  TaskId removed_dependency;
  std::string reason;
};

struct ChangeRecord {
  ChangeAction action{ChangeAction::Add};
  TaskId task_id;
  TaskId depends_on;
  std::optional<std::string> type;
  std::optional<std::string> reason;
  bool forced{false};
  bool cascade_removal{false};
  std::vector<CascadeRemoval> cascade_results;
  std::string timestamp;
};

// Append-only destination for mutation records. The engine never reads
// records back.
class ChangeLogSink {
public:
  virtual ~ChangeLogSink() = default;
  [[nodiscard]] virtual auto append(const ChangeRecord& record)
      -> Result<void> = 0;
};

// One JSON object per line, appended to a file.
class JsonLinesChangeLog final : public ChangeLogSink {
public:
  explicit JsonLinesChangeLog(std::string path);

  [[nodiscard]] auto append(const ChangeRecord& record) -> Result<void> override;

  [[nodiscard]] auto path() const noexcept -> const std::string& {
    return path_;
  }

private:
  std::string path_;
};

// Holds records until the task file they describe has been saved, then
// forwards them to `target` in order. A null target drops them.
class PendingChangeLog final : public ChangeLogSink {
public:
  explicit PendingChangeLog(std::unique_ptr<ChangeLogSink> target);

  [[nodiscard]] auto append(const ChangeRecord& record) -> Result<void> override;

  // Stops at the first failing record; it and the ones after it stay held.
  [[nodiscard]] auto commit() -> Result<void>;

  [[nodiscard]] auto pending() const noexcept -> std::size_t {
    return pending_.size();
  }

private:
  std::unique_ptr<ChangeLogSink> target_;
  std::vector<ChangeRecord> pending_;
};

}  // namespace depgraph
