#pragma once

#include <cstddef>
#include <string>

namespace depgraph {

struct StoreConfig {
  std::string tasks_file{"tasks.json"};
  // Empty disables the JSON-lines change log.
  std::string change_log;
  bool use_lock{true};
};

struct LoggingConfig {
  std::string level{"info"};
  std::string file;
};

struct MutationConfig {
  bool validate_cycles{true};
  bool analyze_impact{true};
  bool cascade_removal{false};
  std::string added_by{"depgraph"};
};

struct AuditConfig {
  std::string checks{"full"};
  std::string min_severity{"info"};
  std::size_t bottleneck_threshold{3};
  std::size_t long_chain_threshold{5};
  bool include_metrics{false};
};

struct EngineConfig {
  StoreConfig store;
  LoggingConfig logging;
  MutationConfig mutation;
  AuditConfig audit;
};

}  // namespace depgraph
