#include "depgraph/config/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "gtest/gtest.h"

using namespace depgraph;

TEST(ConfigTest, Defaults) {
  EngineConfig config;

  EXPECT_EQ(config.store.tasks_file, "tasks.json");
  EXPECT_TRUE(config.store.change_log.empty());
  EXPECT_TRUE(config.store.use_lock);
  EXPECT_EQ(config.logging.level, "info");
  EXPECT_TRUE(config.mutation.validate_cycles);
  EXPECT_TRUE(config.mutation.analyze_impact);
  EXPECT_FALSE(config.mutation.cascade_removal);
  EXPECT_EQ(config.mutation.added_by, "depgraph");
  EXPECT_EQ(config.audit.checks, "full");
  EXPECT_EQ(config.audit.min_severity, "info");
  EXPECT_EQ(config.audit.bottleneck_threshold, 3u);
  EXPECT_EQ(config.audit.long_chain_threshold, 5u);
  EXPECT_FALSE(config.audit.include_metrics);
}

TEST(ConfigTest, LoadFromString) {
  auto result = ConfigLoader::load_from_string(R"(
store:
  tasks_file: /data/tasks.json
  change_log: /data/changes.jsonl
  use_lock: false
logging:
  level: debug
mutation:
  cascade_removal: true
  added_by: ci-bot
audit:
  checks: cycles,redundant
  min_severity: warning
  bottleneck_threshold: 4
  include_metrics: true
)");
  ASSERT_TRUE(result.has_value());
  const auto& config = *result;

  EXPECT_EQ(config.store.tasks_file, "/data/tasks.json");
  EXPECT_EQ(config.store.change_log, "/data/changes.jsonl");
  EXPECT_FALSE(config.store.use_lock);
  EXPECT_EQ(config.logging.level, "debug");
  EXPECT_TRUE(config.mutation.validate_cycles);
  EXPECT_TRUE(config.mutation.cascade_removal);
  EXPECT_EQ(config.mutation.added_by, "ci-bot");
  EXPECT_EQ(config.audit.checks, "cycles,redundant");
  EXPECT_EQ(config.audit.min_severity, "warning");
  EXPECT_EQ(config.audit.bottleneck_threshold, 4u);
  EXPECT_EQ(config.audit.long_chain_threshold, 5u);
  EXPECT_TRUE(config.audit.include_metrics);
}

TEST(ConfigTest, PartialSectionsKeepDefaults) {
  auto result = ConfigLoader::load_from_string("logging:\n  level: warn\n");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->logging.level, "warn");
  EXPECT_EQ(result->store.tasks_file, "tasks.json");
  EXPECT_EQ(result->audit.checks, "full");
}

TEST(ConfigTest, InvalidYamlIsAParseError) {
  auto broken = ConfigLoader::load_from_string("store: [unclosed");
  ASSERT_FALSE(broken.has_value());
  EXPECT_EQ(broken.error(), Error::ParseError);

  auto wrong_shape = ConfigLoader::load_from_string("store: just-a-string\n");
  ASSERT_FALSE(wrong_shape.has_value());
  EXPECT_EQ(wrong_shape.error(), Error::ParseError);

  auto bad_number =
      ConfigLoader::load_from_string("audit:\n  bottleneck_threshold: many\n");
  ASSERT_FALSE(bad_number.has_value());
  EXPECT_EQ(bad_number.error(), Error::ParseError);

  EXPECT_FALSE(ConfigLoader::load_from_string("").has_value());
}

TEST(ConfigTest, MissingFile) {
  auto result = ConfigLoader::load_from_file("/nonexistent/depgraph.yaml");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), Error::FileNotFound);
}

TEST(ConfigTest, LoadFromFile) {
  std::string tmp_pattern = "/tmp/depgraph_config_XXXXXX";
  ASSERT_NE(::mkdtemp(tmp_pattern.data()), nullptr);
  std::filesystem::path dir = tmp_pattern;
  auto path = dir / "depgraph.yaml";
  {
    std::ofstream out(path);
    out << "store:\n  tasks_file: other.json\n";
  }

  auto result = ConfigLoader::load_from_file(path.string());
  std::filesystem::remove_all(dir);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->store.tasks_file, "other.json");
}

TEST(ConfigTest, ToStringReadsBack) {
  EngineConfig config;
  config.store.change_log = "changes.jsonl";
  config.store.use_lock = false;
  config.logging.file = "/var/log/depgraph.log";
  config.mutation.validate_cycles = false;
  config.mutation.added_by = "scheduler";
  config.audit.checks = "orphans";
  config.audit.long_chain_threshold = 8;
  config.audit.include_metrics = true;

  auto yaml = ConfigLoader::to_string(config);
  auto result = ConfigLoader::load_from_string(yaml);
  ASSERT_TRUE(result.has_value()) << yaml;

  EXPECT_EQ(result->store.change_log, "changes.jsonl");
  EXPECT_FALSE(result->store.use_lock);
  EXPECT_EQ(result->logging.file, "/var/log/depgraph.log");
  EXPECT_FALSE(result->mutation.validate_cycles);
  EXPECT_EQ(result->mutation.added_by, "scheduler");
  EXPECT_EQ(result->audit.checks, "orphans");
  EXPECT_EQ(result->audit.long_chain_threshold, 8u);
  EXPECT_EQ(result->audit.bottleneck_threshold, 3u);
  EXPECT_TRUE(result->audit.include_metrics);
}
