#pragma once

#include "depgraph/core/error.hpp"
#include "depgraph/graph/task.hpp"
#include "depgraph/util/id.hpp"

#include <cstdint>
#include <functional>
#include <span>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace depgraph {

using NodeIndex = std::uint32_t;
inline constexpr NodeIndex kInvalidNode = UINT32_MAX;

struct DanglingEdge {
  TaskId from;
  TaskId missing;
};

// Read-only adjacency view over a TaskCollection. Edges point from a task to
// the tasks it depends on. The view borrows the collection: rebuild it after
// any mutation.
class TaskGraph {
public:
  explicit TaskGraph(const TaskCollection& collection);

  [[nodiscard]] auto task_exists(const TaskId& id) const -> bool;
  [[nodiscard]] auto find(const TaskId& id) const -> const Task*;

  // Dependency ids in insertion order, including ids with no task behind them.
  [[nodiscard]] auto neighbors(const TaskId& id) const -> std::vector<TaskId>;
  // Tasks listing `id` as a dependency, in collection order.
  [[nodiscard]] auto dependents(const TaskId& id) const -> std::vector<TaskId>;

  [[nodiscard]] auto all_task_ids() const -> std::unordered_set<TaskId>;
  [[nodiscard]] auto task_ids() const -> const std::vector<TaskId>& {
    return keys_;
  }

  [[nodiscard]] auto get_index(const TaskId& id) const -> NodeIndex;
  [[nodiscard]] auto get_key(NodeIndex idx) const -> const TaskId&;
  [[nodiscard]] auto task(NodeIndex idx) const -> const Task& {
    return *nodes_[idx].task;
  }

  // Edges between existing tasks only; duplicates are kept.
  [[nodiscard]] auto deps_view(NodeIndex idx) const noexcept
      -> std::span<const NodeIndex>;
  [[nodiscard]] auto dependents_view(NodeIndex idx) const noexcept
      -> std::span<const NodeIndex>;
  // Raw dependency list of the task, dangling ids included.
  [[nodiscard]] auto raw_deps(NodeIndex idx) const noexcept
      -> std::span<const TaskId>;

  [[nodiscard]] auto dangling_edges() const -> const std::vector<DanglingEdge>& {
    return dangling_;
  }

  [[nodiscard]] auto edge_count() const noexcept -> std::size_t {
    return edge_count_;
  }
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return nodes_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool {
    return nodes_.empty();
  }

private:
  struct Node {
    const Task* task{nullptr};
    std::vector<NodeIndex> deps;
    std::vector<NodeIndex> dependents;
  };

  std::vector<Node> nodes_;
  std::vector<TaskId> keys_;
  std::unordered_map<TaskId, NodeIndex> key_to_idx_;
  std::vector<DanglingEdge> dangling_;
  std::size_t edge_count_{0};
};

}  // namespace depgraph
