#pragma once

#include "depgraph/core/error.hpp"

#include <string>
#include <utility>

namespace depgraph {

// Advisory exclusive flock on `<tasks file>.lock`, held for one
// load-mutate-save cycle and released on destruction.
class StoreLock {
public:
  [[nodiscard]] static auto acquire(const std::string& tasks_path)
      -> Result<StoreLock>;

  StoreLock(StoreLock&& other) noexcept;
  auto operator=(StoreLock&& other) noexcept -> StoreLock&;
  StoreLock(const StoreLock&) = delete;
  auto operator=(const StoreLock&) -> StoreLock& = delete;
  ~StoreLock();

  [[nodiscard]] auto path() const noexcept -> const std::string& {
    return path_;
  }

private:
  StoreLock(int fd, std::string path) : fd_(fd), path_(std::move(path)) {}

  auto release() noexcept -> void;

  int fd_{-1};
  std::string path_;
};

}  // namespace depgraph
