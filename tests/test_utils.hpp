#pragma once

#include "depgraph/graph/task.hpp"
#include "depgraph/storage/change_log.hpp"
#include "depgraph/util/id.hpp"

#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace depgraph::test {

[[nodiscard]] inline auto task_id(std::string_view s) -> TaskId {
  return TaskId{std::string{s}};
}

[[nodiscard]] inline auto ids(std::initializer_list<std::string_view> list)
    -> std::vector<TaskId> {
  std::vector<TaskId> out;
  for (auto s : list) {
    out.push_back(task_id(s));
  }
  return out;
}

// Fluent task construction for graph fixtures. The title defaults to the id.
class TaskBuilder {
public:
  explicit TaskBuilder(std::string_view id) {
    task_.id = task_id(id);
    task_.title = std::string{id};
  }

  auto title(std::string t) -> TaskBuilder& {
    task_.title = std::move(t);
    return *this;
  }
  auto description(std::string d) -> TaskBuilder& {
    task_.description = std::move(d);
    return *this;
  }
  auto status(TaskStatus s) -> TaskBuilder& {
    task_.status = s;
    return *this;
  }
  auto priority(TaskPriority p) -> TaskBuilder& {
    task_.priority = p;
    return *this;
  }
  auto effort(double e) -> TaskBuilder& {
    task_.effort = e;
    return *this;
  }
  auto skills(std::vector<std::string> s) -> TaskBuilder& {
    task_.skills = std::move(s);
    return *this;
  }
  auto deps(std::initializer_list<std::string_view> list) -> TaskBuilder& {
    task_.dependencies = ids(list);
    return *this;
  }

  [[nodiscard]] auto build() const -> Task { return task_; }
  operator Task() const { return task_; }

private:
  Task task_;
};

[[nodiscard]] inline auto task(std::string_view id) -> TaskBuilder {
  return TaskBuilder{id};
}

[[nodiscard]] inline auto collection(std::initializer_list<Task> tasks)
    -> TaskCollection {
  TaskCollection c;
  c.tasks.assign(tasks.begin(), tasks.end());
  c.recount_dependencies();
  return c;
}

// Keeps every record in memory; can be told to fail appends.
class RecordingChangeLog final : public ChangeLogSink {
public:
  [[nodiscard]] auto append(const ChangeRecord& record) -> Result<void> override {
    if (fail_appends) {
      return fail(Error::FileWriteFailed);
    }
    records.push_back(record);
    return ok();
  }

  std::vector<ChangeRecord> records;
  bool fail_appends{false};
};

}  // namespace depgraph::test
