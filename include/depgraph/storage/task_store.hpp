#pragma once

#include "depgraph/core/error.hpp"
#include "depgraph/graph/task.hpp"

#include <string>
#include <string_view>

namespace depgraph {

// JSON file holding one TaskCollection. Saves go through a temporary file in
// the same directory and a rename, so readers never see a partial write.
class TaskStore {
public:
  explicit TaskStore(std::string path);

  [[nodiscard]] auto load() const -> Result<TaskCollection>;
  [[nodiscard]] auto save(const TaskCollection& collection) const
      -> Result<void>;

  [[nodiscard]] auto path() const noexcept -> const std::string& {
    return path_;
  }

  [[nodiscard]] static auto load_from_string(std::string_view text)
      -> Result<TaskCollection>;
  [[nodiscard]] static auto to_string(const TaskCollection& collection)
      -> std::string;

private:
  std::string path_;
};

}  // namespace depgraph
