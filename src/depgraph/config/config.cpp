#include "depgraph/config/config.hpp"

#include "depgraph/config/yaml_utils.hpp"
#include "depgraph/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<depgraph::StoreConfig> {
  static bool decode(const Node& node, depgraph::StoreConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.tasks_file = depgraph::yaml_get_or<std::string>(node, "tasks_file", "tasks.json");
    s.change_log = depgraph::yaml_get_or<std::string>(node, "change_log", "");
    s.use_lock = depgraph::yaml_get_or(node, "use_lock", true);
    return true;
  }
};

template <>
struct convert<depgraph::LoggingConfig> {
  static bool decode(const Node& node, depgraph::LoggingConfig& l) {
    if (!node.IsMap()) {
      return false;
    }
    l.level = depgraph::yaml_get_or<std::string>(node, "level", "info");
    l.file = depgraph::yaml_get_or<std::string>(node, "file", "");
    return true;
  }
};

template <>
struct convert<depgraph::MutationConfig> {
  static bool decode(const Node& node, depgraph::MutationConfig& m) {
    if (!node.IsMap()) {
      return false;
    }
    m.validate_cycles = depgraph::yaml_get_or(node, "validate_cycles", true);
    m.analyze_impact = depgraph::yaml_get_or(node, "analyze_impact", true);
    m.cascade_removal = depgraph::yaml_get_or(node, "cascade_removal", false);
    m.added_by = depgraph::yaml_get_or<std::string>(node, "added_by", "depgraph");
    return true;
  }
};

template <>
struct convert<depgraph::AuditConfig> {
  static bool decode(const Node& node, depgraph::AuditConfig& a) {
    if (!node.IsMap()) {
      return false;
    }
    a.checks = depgraph::yaml_get_or<std::string>(node, "checks", "full");
    a.min_severity = depgraph::yaml_get_or<std::string>(node, "min_severity", "info");
    a.bottleneck_threshold =
        depgraph::yaml_get_or<std::size_t>(node, "bottleneck_threshold", 3);
    a.long_chain_threshold =
        depgraph::yaml_get_or<std::size_t>(node, "long_chain_threshold", 5);
    a.include_metrics = depgraph::yaml_get_or(node, "include_metrics", false);
    return true;
  }
};

template <>
struct convert<depgraph::EngineConfig> {
  static bool decode(const Node& node, depgraph::EngineConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto store = node["store"]) {
      c.store = store.as<depgraph::StoreConfig>();
    }
    if (auto logging = node["logging"]) {
      c.logging = logging.as<depgraph::LoggingConfig>();
    }
    if (auto mutation = node["mutation"]) {
      c.mutation = mutation.as<depgraph::MutationConfig>();
    }
    if (auto audit = node["audit"]) {
      c.audit = audit.as<depgraph::AuditConfig>();
    }
    return true;
  }
};

}  // namespace YAML

namespace depgraph {

namespace {

void to_yaml(YAML::Emitter& out, const StoreConfig& s) {
  out << YAML::BeginMap;
  yaml_emit(out, "tasks_file", s.tasks_file);
  yaml_emit_if_not_empty(out, "change_log", s.change_log);
  if (!s.use_lock) {
    yaml_emit(out, "use_lock", s.use_lock);
  }
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const LoggingConfig& l) {
  out << YAML::BeginMap;
  yaml_emit(out, "level", l.level);
  yaml_emit_if_not_empty(out, "file", l.file);
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const MutationConfig& m) {
  out << YAML::BeginMap;
  if (!m.validate_cycles) {
    yaml_emit(out, "validate_cycles", m.validate_cycles);
  }
  if (!m.analyze_impact) {
    yaml_emit(out, "analyze_impact", m.analyze_impact);
  }
  if (m.cascade_removal) {
    yaml_emit(out, "cascade_removal", m.cascade_removal);
  }
  yaml_emit(out, "added_by", m.added_by);
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const AuditConfig& a) {
  out << YAML::BeginMap;
  yaml_emit(out, "checks", a.checks);
  yaml_emit(out, "min_severity", a.min_severity);
  if (a.bottleneck_threshold != 3) {
    yaml_emit(out, "bottleneck_threshold", a.bottleneck_threshold);
  }
  if (a.long_chain_threshold != 5) {
    yaml_emit(out, "long_chain_threshold", a.long_chain_threshold);
  }
  if (a.include_metrics) {
    yaml_emit(out, "include_metrics", a.include_metrics);
  }
  out << YAML::EndMap;
}

}  // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<EngineConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<EngineConfig> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ParseError);
    }
    EngineConfig config = root.as<EngineConfig>();
    return ok(std::move(config));
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigLoader::to_string(const EngineConfig& config) -> std::string {
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "store" << YAML::Value;
  to_yaml(out, config.store);
  out << YAML::Key << "logging" << YAML::Value;
  to_yaml(out, config.logging);
  out << YAML::Key << "mutation" << YAML::Value;
  to_yaml(out, config.mutation);
  out << YAML::Key << "audit" << YAML::Value;
  to_yaml(out, config.audit);
  out << YAML::EndMap;
  return out.c_str();
}

}  // namespace depgraph
