#pragma once

#include "depgraph/graph/task.hpp"

#include <string>
#include <string_view>

namespace depgraph {

struct TypeValidation {
  bool is_valid{true};
  std::string reason;
};

// Semantic rules per dependency type, checked against the status and
// priority of both endpoints. Advisory: a forced mutation may ignore it.
class EdgeTypeValidator {
public:
  [[nodiscard]] static auto validate(const Task& task, const Task& dependency,
                                     std::string_view type) -> TypeValidation;

  [[nodiscard]] static auto validate(const Task& task, const Task& dependency,
                                     DependencyType type) -> TypeValidation;
};

}  // namespace depgraph
