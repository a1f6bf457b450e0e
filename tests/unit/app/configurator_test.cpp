/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <fstream>

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "app/configuration.hpp"
#include "app/configurator.hpp"
#include "testutil/storage/base_fs_test.hpp"

using namespace std::chrono_literals;
using ringstore::app::Configuration;
using ringstore::app::Configurator;
using ringstore::codec::FieldType;

class ConfiguratorTest : public test::BaseFS_Test {
 public:
  ConfiguratorTest() : test::BaseFS_Test("/tmp/ringstore-test-configurator") {}

  std::string writeConfig(const std::string &yaml) {
    auto path = base_path / "config.yaml";
    std::ofstream{path} << yaml;
    return path.string();
  }

  /// Runs both parsing steps and builds the configuration
  outcome::result<std::shared_ptr<Configuration>> configure(
      std::vector<std::string> args) {
    args.insert(args.begin(), "ringstore");
    std::vector<const char *> argv;
    for (auto &arg : args) {
      argv.push_back(arg.c_str());
    }
    argv.push_back(nullptr);
    const char *env[] = {nullptr};

    Configurator configurator(
        static_cast<int>(args.size()), argv.data(), env);
    OUTCOME_TRY(step1, configurator.step1());
    EXPECT_FALSE(step1);
    OUTCOME_TRY(step2, configurator.step2());
    EXPECT_FALSE(step2);
    return configurator.calculateConfig(logger);
  }

  ringstore::log::Logger logger =
      testutil::prepareLoggers()->getLogger("Configurator", "testing");

  static constexpr auto kConfig = R"(
general:
  base-path: .
database:
  flush_delay: 250ms
  rings:
    - file: archive.yaml
      readonly: true
      stop_id: 100
    - name: live
      file: data/live.jl
      start_id: 100
    - name: scratch
      format: memory
  indexes:
    - name: by_tag
      category: post
      key:
        - { field: tags$, type: string }
        - { field: id, type: uint }
      payload: [title]
    - name: by_age
      key:
        - { field: age, type: int, length: 2, nullable: true }
)";
};

/**
 * @given config file with rings and indexes
 * @when build the configuration
 * @then rings are resolved against the file directory and indexes are typed
 */
TEST_F(ConfiguratorTest, ConfigFile) {
  ASSERT_OUTCOME_SUCCESS(config,
                         configure({"--config", writeConfig(kConfig), "scan"}));
  auto base = std::filesystem::weakly_canonical(base_path);
  EXPECT_EQ(config->basePath(), base);
  EXPECT_EQ(config->flushDelay(), 250ms);

  const auto &rings = config->database().rings;
  ASSERT_EQ(rings.size(), 3);
  EXPECT_EQ(rings[0].data.path, base / "archive.yaml");
  EXPECT_TRUE(rings[0].range.readonly);
  EXPECT_EQ(rings[0].range.stop, 100);
  EXPECT_EQ(rings[1].name, "live");
  EXPECT_EQ(rings[1].data.path, base / "data" / "live.jl");
  EXPECT_EQ(rings[1].range.start, 100);
  EXPECT_FALSE(rings[1].range.stop.has_value());
  EXPECT_EQ(rings[2].data.format, "memory");

  const auto &indexes = config->database().indexes;
  ASSERT_EQ(indexes.size(), 2);
  EXPECT_EQ(indexes[0].category, "post");
  ASSERT_EQ(indexes[0].key.size(), 2);
  EXPECT_EQ(indexes[0].key[0].name, "tags");
  EXPECT_TRUE(indexes[0].key[0].plural);
  EXPECT_EQ(indexes[0].key[1].type, FieldType::unsignedInt());
  EXPECT_EQ(indexes[0].payload, std::vector<std::string>{"title"});
  EXPECT_EQ(indexes[1].key[0].type, FieldType::signedInt(2, true));

  EXPECT_EQ(config->command().name, "scan");
}

/**
 * @given config file and command line options
 * @when build the configuration
 * @then command line values take precedence
 */
TEST_F(ConfiguratorTest, CommandLineOverrides) {
  ASSERT_OUTCOME_SUCCESS(config,
                         configure({"--config",
                                    writeConfig(kConfig),
                                    "--flush-delay",
                                    "0",
                                    "--ring",
                                    "one.yaml",
                                    "--ring",
                                    "two.yaml",
                                    "insert",
                                    R"({"a":1})",
                                    "--id",
                                    "7",
                                    "--target",
                                    "two",
                                    "--global-unique"}));
  EXPECT_EQ(config->flushDelay(), 0ms);
  ASSERT_EQ(config->database().rings.size(), 2);
  EXPECT_EQ(config->database().rings[1].data.path.filename(), "two.yaml");

  const auto &command = config->command();
  EXPECT_EQ(command.name, "insert");
  EXPECT_EQ(command.args, std::vector<std::string>{R"({"a":1})"});
  EXPECT_EQ(command.id, 7);
  EXPECT_EQ(command.target, "two");
  EXPECT_TRUE(command.global_unique);
}

/**
 * @given scan-index command with bounds and paging
 * @when build the configuration
 * @then options are collected into the command
 */
TEST_F(ConfiguratorTest, ScanIndexOptions) {
  ASSERT_OUTCOME_SUCCESS(config,
                         configure({"--ring",
                                    "data.yaml",
                                    "scan-index",
                                    "by_tag",
                                    "--start",
                                    R"( ["a"] )",
                                    "--offset",
                                    "2",
                                    "--limit",
                                    "5"}));
  const auto &command = config->command();
  EXPECT_EQ(command.args, std::vector<std::string>{"by_tag"});
  EXPECT_EQ(command.start, R"(["a"])");
  EXPECT_FALSE(command.stop.has_value());
  EXPECT_EQ(command.offset, 2);
  EXPECT_EQ(command.limit, 5);
}

/**
 * @given config file with malformed rings and indexes
 * @when build the configuration
 * @then the file is rejected
 */
TEST_F(ConfiguratorTest, FileErrors) {
  auto path = writeConfig(R"(
database:
  flush_delay: soon
  rings:
    - file: a.yaml
      start_id: 10
      stop_id: 5
    - format: memory
  indexes:
    - name: bad
      key:
        - { field: x, type: float }
        - { field: y$, type: string }
)");
  EXPECT_OUTCOME_ERROR(configure({"--config", path, "scan"}),
                       Configurator::Error::ConfigFileParseFailed);
}

/**
 * @given neither config file nor ring options
 * @when build the configuration
 * @then it fails because there are no rings
 */
TEST_F(ConfiguratorTest, NoRings) {
  EXPECT_OUTCOME_ERROR(configure({"scan"}), Configurator::Error::InvalidValue);
}

/**
 * @given invalid command line values
 * @when build the configuration
 * @then parsing fails
 */
TEST_F(ConfiguratorTest, BadCommandLine) {
  EXPECT_OUTCOME_ERROR(configure({"--ring", "a.yaml", "--flush-delay", "x"}),
                       Configurator::Error::CliArgsParseFailed);
  EXPECT_OUTCOME_ERROR(configure({"--unknown-option"}),
                       Configurator::Error::CliArgsParseFailed);
}
