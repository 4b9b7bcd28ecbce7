#include "depgraph/storage/task_store.hpp"

#include "depgraph/storage/json_codec.hpp"
#include "depgraph/util/log.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>
#include <system_error>
#include <unistd.h>

namespace depgraph {

TaskStore::TaskStore(std::string path) : path_(std::move(path)) {}

auto TaskStore::load() const -> Result<TaskCollection> {
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    log::error("Tasks file not found: {}", path_);
    return fail(Error::FileNotFound);
  }

  std::ifstream file(path_);
  if (!file.is_open()) {
    log::error("Failed to open tasks file: {}", path_);
    return fail(Error::FileOpenFailed);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto TaskStore::save(const TaskCollection& collection) const -> Result<void> {
  auto target = std::filesystem::path(path_);
  auto tmp = target;
  tmp += std::format(".tmp.{}", ::getpid());

  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out.is_open()) {
      log::error("Failed to open {} for writing", tmp.string());
      return fail(Error::FileOpenFailed);
    }
    try {
      out << to_string(collection) << '\n';
    } catch (const nlohmann::json::exception& e) {
      log::error("Failed to encode tasks for {}: {}", path_, e.what());
      out.close();
      std::error_code ignored;
      std::filesystem::remove(tmp, ignored);
      return fail(Error::FileWriteFailed);
    }
    out.flush();
    if (!out) {
      log::error("Failed to write {}", tmp.string());
      std::error_code ignored;
      std::filesystem::remove(tmp, ignored);
      return fail(Error::FileWriteFailed);
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp, target, ec);
  if (ec) {
    log::error("Failed to replace {}: {}", path_, ec.message());
    std::error_code ignored;
    std::filesystem::remove(tmp, ignored);
    return fail(Error::FileWriteFailed);
  }
  log::debug("Saved {} tasks to {}", collection.tasks.size(), path_);
  return ok();
}

auto TaskStore::load_from_string(std::string_view text)
    -> Result<TaskCollection> {
  try {
    auto j = nlohmann::json::parse(text);
    if (!j.is_object()) {
      log::error("Invalid tasks file format: top level is not an object");
      return fail(Error::ParseError);
    }
    return ok(j.get<TaskCollection>());
  } catch (const nlohmann::json::exception& e) {
    log::error("Invalid tasks file format: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto TaskStore::to_string(const TaskCollection& collection) -> std::string {
  nlohmann::json j = collection;
  return j.dump(2);
}

}  // namespace depgraph
