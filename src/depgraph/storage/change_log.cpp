#include "depgraph/storage/change_log.hpp"

#include "depgraph/storage/json_codec.hpp"
#include "depgraph/util/log.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

namespace depgraph {

JsonLinesChangeLog::JsonLinesChangeLog(std::string path)
    : path_(std::move(path)) {}

auto JsonLinesChangeLog::append(const ChangeRecord& record) -> Result<void> {
  auto parent = std::filesystem::path(path_).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      log::error("Failed to create change log directory {}: {}",
                 parent.string(), ec.message());
      return fail(Error::FileOpenFailed);
    }
  }

  std::ofstream out(path_, std::ios::app);
  if (!out.is_open()) {
    log::error("Failed to open change log: {}", path_);
    return fail(Error::FileOpenFailed);
  }

  nlohmann::json j = record;
  out << j.dump() << '\n';
  if (!out) {
    log::error("Failed to append to change log: {}", path_);
    return fail(Error::FileWriteFailed);
  }
  return ok();
}

PendingChangeLog::PendingChangeLog(std::unique_ptr<ChangeLogSink> target)
    : target_(std::move(target)) {}

auto PendingChangeLog::append(const ChangeRecord& record) -> Result<void> {
  pending_.push_back(record);
  return ok();
}

auto PendingChangeLog::commit() -> Result<void> {
  if (target_ == nullptr) {
    pending_.clear();
    return ok();
  }
  std::size_t written = 0;
  for (; written < pending_.size(); ++written) {
    if (auto r = target_->append(pending_[written]); !r) {
      pending_.erase(pending_.begin(),
                     pending_.begin() + static_cast<std::ptrdiff_t>(written));
      return r;
    }
  }
  pending_.clear();
  return ok();
}

}  // namespace depgraph
