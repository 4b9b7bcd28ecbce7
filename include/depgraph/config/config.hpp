#pragma once

#include "depgraph/config/engine_config.hpp"
#include "depgraph/core/error.hpp"

#include <string>
#include <string_view>

namespace depgraph {

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<EngineConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<EngineConfig>;
  // YAML text that load_from_string reads back to an equal config. Fields
  // at their default value are left out.
  [[nodiscard]] static auto to_string(const EngineConfig& config)
      -> std::string;
};

}  // namespace depgraph
