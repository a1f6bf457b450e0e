/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configurator.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <print>
#include <string>
#include <string_view>

#include <boost/algorithm/string/trim.hpp>
#include <boost/assert.hpp>
#include <boost/program_options.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <fmt/format.h>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "app/build_version.hpp"
#include "app/configuration.hpp"
#include "app/default_config.hpp"
#include "codec/field_type.hpp"
#include "log/formatters/filepath.hpp"
#include "utils/parsers.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(ringstore::app, Configurator::Error, e) {
  using E = ringstore::app::Configurator::Error;
  switch (e) {
    case E::CliArgsParseFailed:
      return "CLI Arguments parse failed";
    case E::ConfigFileParseFailed:
      return "Config file parse failed";
    case E::InvalidValue:
      return "Result config has invalid values";
  }
  BOOST_UNREACHABLE_RETURN("Unknown log::Error");
}

namespace {
  template <typename T, typename Func>
  void find_argument(boost::program_options::variables_map &vm,
                     const char *name,
                     Func &&f) {
    BOOST_ASSERT(nullptr != name);
    if (auto it = vm.find(name); it != vm.end()) {
      if (it->second.defaulted()) {
        return;
      }
      std::forward<Func>(f)(it->second.as<T>());
    }
  }

  bool find_argument(boost::program_options::variables_map &vm,
                     const std::string &name) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (!it->second.defaulted()) {
        return true;
      }
    }
    return false;
  }

  /// Scalar of a YAML map as T; reports and returns nullopt if malformed
  template <typename T>
  std::optional<T> scalar(const YAML::Node &node,
                          std::string_view where,
                          std::ostringstream &errors,
                          bool &has_error) {
    if (not node.IsScalar()) {
      errors << "E: Value '" << where << "' must be scalar\n";
      has_error = true;
      return std::nullopt;
    }
    try {
      return node.as<T>();
    } catch (const YAML::Exception &) {
      errors << "E: Value '" << where << "' has wrong type\n";
      has_error = true;
      return std::nullopt;
    }
  }

}  // namespace

namespace ringstore::app {

  Configurator::Configurator(int argc, const char **argv, const char **env)
      : argc_(argc), argv_(argv), env_(env) {
    config_ = std::make_shared<Configuration>();

    config_->version_ = buildVersion();

    namespace po = boost::program_options;

    // clang-format off

    po::options_description general_options("General options", 120, 100);
    general_options.add_options()
        ("help,h", "Show this help message.")
        ("version,v", "Show version information.")
        ("base-path", po::value<std::string>(), "Set base path. All relative paths will be resolved based on this path.")
        ("config,c", po::value<std::string>(),  "Optional. Filepath to load configuration from. Overrides default configuration values.")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter.\n"
          "Syntax: <target>=<level>, e.g., -ldb=debug.\n"
          "Log levels: trace, debug, verbose, info, warn, error, critical, off.\n"
          "Default: all targets log at `info`.\n"
          "Global log level can be set with: -l<level>.")
        ;

    po::options_description database_options("Database options");
    database_options.add_options()
        ("flush-delay", po::value<std::string>(), "Delay of flushes after changes, e.g. 500ms, 2s. Zero flushes on every change.")
        ("ring", po::value<std::vector<std::string>>(), "Ring file, bottom to top. Replaces rings of the config file.")
        ;

    po::options_description command_options("Command options");
    command_options.add_options()
        ("id", po::value<db::ObjectId>(), "insert: id of the new object.")
        ("target", po::value<std::string>(), "insert: name of the ring to insert into.")
        ("global-unique", "insert: check the id in all rings.")
        ("start", po::value<std::string>(), "scan: first id; scan-index: JSON array of leading key fields.")
        ("stop", po::value<std::string>(), "scan: id after the range; scan-index: JSON array of leading key fields.")
        ("offset", po::value<size_t>(), "scan-index: number of records to skip.")
        ("limit", po::value<size_t>(), "scan-index: max number of records.")
        ;

    po::options_description hidden_options;
    hidden_options.add_options()
        ("command", po::value<std::vector<std::string>>(), "Command and its arguments.")
        ;

    // clang-format on

    cli_options_
        .add(general_options)  //
        .add(database_options)
        .add(command_options)
        .add(hidden_options);

    cli_positional_.add("command", -1);
  }

  outcome::result<bool> Configurator::step1() {  // read min cli-args and config
    namespace po = boost::program_options;
    namespace fs = std::filesystem;

    po::options_description options;
    options.add_options()("help,h", "show help")("version,v", "show version")(
        "config,c", po::value<std::string>(), "config-file path");

    po::variables_map vm;

    // first-run parse to read-only general options and to lookup for "help",
    // "config" and "version". all the rest options are ignored
    try {
      po::parsed_options parsed = po::command_line_parser(argc_, argv_)
                                      .options(options)
                                      .allow_unregistered()
                                      .run();
      po::store(parsed, vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    if (vm.contains("help")) {
      std::cout << "Ringstore version " << buildVersion() << '\n';
      std::cout << "Usage: ringstore [options] <command> [args]\n";
      std::cout << cli_options_ << '\n';
      std::println(std::cout, "Commands:");
      std::println(std::cout, "  select <id>");
      std::println(std::cout, "  insert <json>");
      std::println(std::cout, "  update <id> <merge-patch-json>");
      std::println(std::cout, "  delete <id>");
      std::println(std::cout, "  scan");
      std::println(std::cout, "  scan-index <name>");
      std::println(std::cout, "  rebuild-indexes");
      std::println(std::cout, "  erase <ring>");
      return true;
    }

    if (vm.contains("version")) {
      std::cout << "Ringstore version " << buildVersion() << '\n';
      return true;
    }

    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      try {
        config_file_ = YAML::LoadFile(path);
        config_file_path_ = fs::weakly_canonical(fs::absolute(path));
      } catch (const std::exception &exception) {
        std::cerr << "Error: Can't parse file "
                  << std::filesystem::weakly_canonical(path) << ": "
                  << exception.what() << "\n"
                  << "Option --config must be path to correct yaml-file\n"
                  << "Try run with option '--help' for more information\n";
        return Error::ConfigFileParseFailed;
      }
    }

    return false;
  }

  outcome::result<bool> Configurator::step2() {
    namespace po = boost::program_options;
    namespace fs = std::filesystem;

    try {
      // second-run parse to gather all known options
      // with reporting about any unrecognized input
      po::parsed_options parsed = po::command_line_parser(argc_, argv_)
                                      .options(cli_options_)
                                      .positional(cli_positional_)
                                      .run();
      po::store(parsed, cli_values_map_);
      po::notify(cli_values_map_);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    find_argument<std::vector<std::string>>(
        cli_values_map_, "log", [&](const std::vector<std::string> &value) {
          logger_cli_args_ = value;
        });

    return false;
  }

  outcome::result<YAML::Node> Configurator::getLoggingConfig() {
    auto load_default = [&]() -> outcome::result<YAML::Node> {
      try {
        return YAML::Load(std::string(kDefaultLoggingYaml));
      } catch (const std::exception &e) {
        file_errors_ << "E: Failed to load default logging config: " << e.what()
                     << "\n";
        return Error::ConfigFileParseFailed;
      }
    };

    if (not config_file_.has_value()) {
      return load_default();
    }
    auto logging = (*config_file_)["logging"];
    if (logging.IsDefined()) {
      return logging;
    }
    return load_default();
  }

  outcome::result<std::shared_ptr<Configuration>> Configurator::calculateConfig(
      qtils::SharedRef<soralog::Logger> logger) {
    logger_ = std::move(logger);
    OUTCOME_TRY(initGeneralConfig());
    OUTCOME_TRY(initDatabaseConfig());
    OUTCOME_TRY(initCommandConfig());

    return config_;
  }

  outcome::result<void> Configurator::reportFileErrors() {
    if (not file_has_error_) {
      return outcome::success();
    }
    SL_ERROR(logger_, "Config file `{}` has some problems:", config_file_path_);
    std::istringstream iss(file_errors_.str());
    std::string line;
    while (std::getline(iss, line)) {
      SL_ERROR(logger_, "  {}", std::string_view(line).substr(3));
    }
    return Error::ConfigFileParseFailed;
  }

  outcome::result<void> Configurator::initGeneralConfig() {
    // Relative paths of the config file are relative to its directory
    if (config_file_.has_value()) {
      config_->base_path_ = config_file_path_.parent_path();
    } else {
      config_->base_path_ = std::filesystem::current_path();
    }

    // Init by config-file
    if (config_file_.has_value()) {
      auto section = (*config_file_)["general"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          auto base_path = section["base-path"];
          if (base_path.IsDefined()) {
            if (base_path.IsScalar()) {
              auto value = base_path.as<std::string>();
              config_->base_path_ = config_->base_path_ / value;
            } else {
              file_errors_ << "E: Value 'general.base-path' must be scalar\n";
              file_has_error_ = true;
            }
          }
        } else {
          file_errors_ << "E: Section 'general' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }

    OUTCOME_TRY(reportFileErrors());

    // Adjust by CLI arguments
    find_argument<std::string>(
        cli_values_map_, "base-path", [&](const std::string &value) {
          config_->base_path_ = std::filesystem::absolute(value);
        });

    // Check values
    config_->base_path_ = weakly_canonical(config_->base_path_);
    if (not is_directory(config_->base_path_)) {
      SL_ERROR(logger_,
               "The 'base_path' does not exist or is not a directory: {}",
               config_->base_path_);
      return Error::InvalidValue;
    }

    return outcome::success();
  }

  void Configurator::parseRings(const YAML::Node &rings) {
    if (not rings.IsSequence()) {
      file_errors_ << "E: Value 'database.rings' must be a list\n";
      file_has_error_ = true;
      return;
    }
    size_t i = 0;
    for (const auto &ring : rings) {
      auto where = fmt::format("database.rings[{}]", i++);
      if (not ring.IsMap()) {
        file_errors_ << "E: Value '" << where << "' must be map\n";
        file_has_error_ = true;
        continue;
      }
      db::RingConfig config;
      if (auto file = ring["file"]; file.IsDefined()) {
        if (auto value = scalar<std::string>(
                file, where + ".file", file_errors_, file_has_error_)) {
          config.data.path = *value;
        }
      }
      if (auto format = ring["format"]; format.IsDefined()) {
        if (auto value = scalar<std::string>(
                format, where + ".format", file_errors_, file_has_error_)) {
          config.data.format = *value;
        }
      }
      if (config.data.path.empty() and config.data.format != "memory") {
        file_errors_ << "E: Value '" << where
                     << "' must have 'file' or 'format: memory'\n";
        file_has_error_ = true;
      }
      if (auto name = ring["name"]; name.IsDefined()) {
        if (auto value = scalar<std::string>(
                name, where + ".name", file_errors_, file_has_error_)) {
          config.name = *value;
        }
      }
      if (config.name.empty() and config.data.path.empty()) {
        file_errors_ << "E: Value '" << where
                     << "' of memory format must have 'name'\n";
        file_has_error_ = true;
      }
      if (auto readonly = ring["readonly"]; readonly.IsDefined()) {
        if (auto value = scalar<bool>(readonly,
                                      where + ".readonly",
                                      file_errors_,
                                      file_has_error_)) {
          config.range.readonly = *value;
        }
      }
      if (auto start = ring["start_id"]; start.IsDefined()) {
        if (auto value = scalar<db::ObjectId>(
                start, where + ".start_id", file_errors_, file_has_error_)) {
          config.range.start = *value;
        }
      }
      if (auto stop = ring["stop_id"]; stop.IsDefined()) {
        if (auto value = scalar<db::ObjectId>(
                stop, where + ".stop_id", file_errors_, file_has_error_)) {
          config.range.stop = *value;
        }
      }
      if (config.range.stop.has_value()
          and *config.range.stop <= config.range.start) {
        file_errors_ << "E: Value '" << where
                     << ".stop_id' must be greater than start_id\n";
        file_has_error_ = true;
      }
      config_->database_.rings.emplace_back(std::move(config));
    }
  }

  void Configurator::parseIndexes(const YAML::Node &indexes) {
    if (not indexes.IsSequence()) {
      file_errors_ << "E: Value 'database.indexes' must be a list\n";
      file_has_error_ = true;
      return;
    }
    size_t i = 0;
    for (const auto &index : indexes) {
      auto where = fmt::format("database.indexes[{}]", i++);
      if (not index.IsMap()) {
        file_errors_ << "E: Value '" << where << "' must be map\n";
        file_has_error_ = true;
        continue;
      }
      db::IndexConfig config;
      if (auto name = scalar<std::string>(
              index["name"], where + ".name", file_errors_, file_has_error_)) {
        config.name = *name;
      }
      if (auto category = index["category"]; category.IsDefined()) {
        config.category = scalar<std::string>(
            category, where + ".category", file_errors_, file_has_error_);
      }

      auto key = index["key"];
      if (not key.IsSequence() or key.size() == 0) {
        file_errors_ << "E: Value '" << where
                     << ".key' must be a non-empty list\n";
        file_has_error_ = true;
        continue;
      }
      size_t j = 0;
      for (const auto &field : key) {
        auto field_where = fmt::format("{}.key[{}]", where, j++);
        auto name = scalar<std::string>(
            field["field"], field_where + ".field", file_errors_, file_has_error_);
        auto type_name = scalar<std::string>(
            field["type"], field_where + ".type", file_errors_, file_has_error_);
        if (not name or not type_name) {
          continue;
        }
        size_t length = 0;
        bool nullable = false;
        if (auto node = field["length"]; node.IsDefined()) {
          length = scalar<size_t>(node,
                                  field_where + ".length",
                                  file_errors_,
                                  file_has_error_)
                       .value_or(0);
        }
        if (auto node = field["nullable"]; node.IsDefined()) {
          nullable = scalar<bool>(node,
                                  field_where + ".nullable",
                                  file_errors_,
                                  file_has_error_)
                         .value_or(false);
        }
        auto type = codec::FieldType::fromName(*type_name, length, nullable);
        if (type.has_error()) {
          file_errors_ << "E: Value '" << field_where << ".type' is unknown: "
                       << *type_name << "\n";
          file_has_error_ = true;
          continue;
        }
        bool plural = name->ends_with('$');
        if (plural) {
          name->pop_back();
        }
        if (plural and j != 1) {
          file_errors_ << "E: Value '" << field_where
                       << "': only the first key field may be plural\n";
          file_has_error_ = true;
          continue;
        }
        config.key.push_back(
            {.name = *name, .type = type.value(), .plural = plural});
      }

      if (auto payload = index["payload"]; payload.IsDefined()) {
        if (payload.IsSequence()) {
          for (const auto &field : payload) {
            if (auto value = scalar<std::string>(field,
                                                 where + ".payload[]",
                                                 file_errors_,
                                                 file_has_error_)) {
              config.payload.emplace_back(std::move(*value));
            }
          }
        } else {
          file_errors_ << "E: Value '" << where << ".payload' must be a list\n";
          file_has_error_ = true;
        }
      }
      config_->database_.indexes.emplace_back(std::move(config));
    }
  }

  outcome::result<void> Configurator::initDatabaseConfig() {
    // Init by config-file
    if (config_file_.has_value()) {
      auto section = (*config_file_)["database"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          auto flush_delay = section["flush_delay"];
          if (flush_delay.IsDefined()) {
            if (flush_delay.IsScalar()) {
              auto value = util::parseDelay(flush_delay.as<std::string>());
              if (value.has_value()) {
                config_->flush_delay_ = value.value();
              } else {
                file_errors_ << "E: Bad 'database.flush_delay' value; "
                                "Expected: 1000, 500ms, 2s, etc.\n";
                file_has_error_ = true;
              }
            } else {
              file_errors_ << "E: Value 'database.flush_delay' must be scalar\n";
              file_has_error_ = true;
            }
          }
          if (auto rings = section["rings"]; rings.IsDefined()) {
            parseRings(rings);
          }
          if (auto indexes = section["indexes"]; indexes.IsDefined()) {
            parseIndexes(indexes);
          }
        } else {
          file_errors_ << "E: Section 'database' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }

    OUTCOME_TRY(reportFileErrors());

    // Adjust by CLI arguments
    bool fail;

    fail = false;
    find_argument<std::string>(
        cli_values_map_, "flush-delay", [&](const std::string &value) {
          auto delay = util::parseDelay(value);
          if (delay.has_value()) {
            config_->flush_delay_ = delay.value();
          } else {
            std::cerr << "Option --flush-delay has invalid value\n"
                      << "Try run with option '--help' for more information\n";
            fail = true;
          }
        });
    if (fail) {
      return Error::CliArgsParseFailed;
    }

    find_argument<std::vector<std::string>>(
        cli_values_map_, "ring", [&](const std::vector<std::string> &files) {
          config_->database_.rings.clear();
          for (const auto &file : files) {
            config_->database_.rings.push_back({.name = {},
                                                .data = {.format = {},
                                                         .path = file},
                                                .range = {}});
          }
        });

    // Check values
    auto make_absolute = [&](const std::filesystem::path &path) {
      return weakly_canonical(
          path.is_absolute() ? path : (config_->base_path_ / path));
    };

    if (config_->database_.rings.empty()) {
      SL_ERROR(logger_, "No rings are configured");
      return Error::InvalidValue;
    }
    for (auto &ring : config_->database_.rings) {
      if (not ring.data.path.empty()) {
        ring.data.path = make_absolute(ring.data.path);
      }
    }

    return outcome::success();
  }

  outcome::result<void> Configurator::initCommandConfig() {
    auto &command = config_->command_;

    find_argument<std::vector<std::string>>(
        cli_values_map_, "command", [&](const std::vector<std::string> &value) {
          command.name = value.front();
          command.args.assign(value.begin() + 1, value.end());
        });
    find_argument<db::ObjectId>(
        cli_values_map_, "id", [&](const db::ObjectId &value) {
          command.id = value;
        });
    find_argument<std::string>(
        cli_values_map_, "target", [&](const std::string &value) {
          command.target = value;
        });
    command.global_unique = find_argument(cli_values_map_, "global-unique");
    find_argument<std::string>(
        cli_values_map_, "start", [&](const std::string &value) {
          command.start = boost::trim_copy(value);
        });
    find_argument<std::string>(
        cli_values_map_, "stop", [&](const std::string &value) {
          command.stop = boost::trim_copy(value);
        });
    find_argument<size_t>(cli_values_map_, "offset", [&](const size_t &value) {
      command.offset = value;
    });
    find_argument<size_t>(cli_values_map_, "limit", [&](const size_t &value) {
      command.limit = value;
    });

    return outcome::success();
  }

}  // namespace ringstore::app
