/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <charconv>
#include <iostream>
#include <memory>
#include <system_error>

#include <boost/asio/io_context.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>
#include <qtils/final_action.hpp>
#include <soralog/impl/configurator_from_yaml.hpp>
#include <soralog/logging_system.hpp>

#include "app/configuration.hpp"
#include "app/configurator.hpp"
#include "codec/codec_error.hpp"
#include "db/database.hpp"
#include "db/database_error.hpp"
#include "log/logger.hpp"
#include "serde/json.hpp"

// NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)

namespace {
  void wrong_usage() {
    std::cerr << "Wrong usage.\n"
                 "Run with `--help' argument to print usage\n";
  }

  using ringstore::app::Configuration;
  using ringstore::db::Database;
  using ringstore::db::ObjectId;
  using ringstore::log::LoggingSystem;

  std::optional<ObjectId> parse_id(std::string_view str) {
    ObjectId id{};
    auto [ptr, ec] = std::from_chars(str.begin(), str.end(), id);
    if (ec != std::errc() or ptr != str.end()) {
      return std::nullopt;
    }
    return id;
  }

  /// Leading key fields of index `index` given as JSON array
  outcome::result<ringstore::codec::Fields> parse_bound(
      const ringstore::codec::RecordSchema &schema, std::string_view str) {
    OUTCOME_TRY(json, ringstore::json::parse(str));
    if (not json.IsArray() or json.Size() > schema.key().size()) {
      return ringstore::codec::CodecError::SCHEMA_MISMATCH;
    }
    ringstore::codec::Fields fields;
    for (rapidjson::SizeType i = 0; i < json.Size(); ++i) {
      OUTCOME_TRY(field,
                  ringstore::codec::fieldFromJson(json[i],
                                                  schema.key()[i].type));
      fields.emplace_back(std::move(field));
    }
    return fields;
  }

  std::string record_json(const ringstore::codec::Record &record) {
    rapidjson::Document document;
    document.SetObject();
    auto &allocator = document.GetAllocator();

    rapidjson::Value key{rapidjson::kArrayType};
    if (auto fields = record.fields(); fields.has_value()) {
      for (const auto &field : fields.value()) {
        key.PushBack(ringstore::codec::fieldToJson(field, allocator),
                     allocator);
      }
    }
    document.AddMember("key", key, allocator);

    rapidjson::Value payload;
    if (auto decoded = record.payload(); decoded.has_value()) {
      payload.CopyFrom(decoded.value(), allocator);
    }
    document.AddMember("payload", payload, allocator);
    return ringstore::json::stringify(document);
  }

  outcome::result<void> execute(Database &database,
                                const Configuration::CommandConfig &command) {
    using ringstore::db::DatabaseError;
    const auto &args = command.args;
    auto id_arg = [&]() -> outcome::result<ObjectId> {
      if (args.empty()) {
        return ringstore::app::Configurator::Error::CliArgsParseFailed;
      }
      auto id = parse_id(args.front());
      if (not id.has_value()) {
        return ringstore::app::Configurator::Error::CliArgsParseFailed;
      }
      return id.value();
    };

    if (command.name == "select") {
      OUTCOME_TRY(id, id_arg());
      OUTCOME_TRY(data, database.select(id));
      fmt::println("{}", data);

    } else if (command.name == "insert") {
      if (args.empty()) {
        return ringstore::app::Configurator::Error::CliArgsParseFailed;
      }
      OUTCOME_TRY(ringstore::json::parse(args.front()));
      OUTCOME_TRY(id,
                  database.insert(command.id,
                                  args.front(),
                                  {.ring = command.target,
                                   .global_unique = command.global_unique}));
      fmt::println(R"({{"id":{}}})", id);

    } else if (command.name == "update") {
      OUTCOME_TRY(id, id_arg());
      if (args.size() < 2) {
        return ringstore::app::Configurator::Error::CliArgsParseFailed;
      }
      OUTCOME_TRY(
          data,
          database.update(id, {ringstore::db::Edit::mergePatch(args[1])}));
      fmt::println("{}", data);

    } else if (command.name == "delete") {
      OUTCOME_TRY(id, id_arg());
      OUTCOME_TRY(deleted, database.remove(id));
      fmt::println(R"({{"deleted":{}}})", deleted);

    } else if (command.name == "scan") {
      std::optional<ObjectId> start;
      std::optional<ObjectId> stop;
      if (command.start.has_value()) {
        start = parse_id(*command.start);
        if (not start.has_value()) {
          return ringstore::app::Configurator::Error::CliArgsParseFailed;
        }
      }
      if (command.stop.has_value()) {
        stop = parse_id(*command.stop);
        if (not stop.has_value()) {
          return ringstore::app::Configurator::Error::CliArgsParseFailed;
        }
      }
      OUTCOME_TRY(objects, database.scan(start, stop));
      for (const auto &[id, data] : objects) {
        fmt::println(R"({{"id":{},"data":{}}})", id, data);
      }

    } else if (command.name == "scan-index") {
      if (args.empty()) {
        return ringstore::app::Configurator::Error::CliArgsParseFailed;
      }
      const auto &name = args.front();
      auto top = database.top();
      auto index = top ? top->findIndex(name) : nullptr;
      if (index == nullptr) {
        return DatabaseError::INDEX_NOT_FOUND;
      }
      Database::IndexScan scan{.offset = command.offset,
                               .limit = command.limit};
      if (command.start.has_value()) {
        OUTCOME_TRY(fields, parse_bound(*index->schema(), *command.start));
        scan.start = std::move(fields);
      }
      if (command.stop.has_value()) {
        OUTCOME_TRY(fields, parse_bound(*index->schema(), *command.stop));
        scan.stop = std::move(fields);
      }
      OUTCOME_TRY(records, database.scanIndex(name, scan));
      for (const auto &record : records) {
        fmt::println("{}", record_json(record));
      }

    } else if (command.name == "rebuild-indexes") {
      OUTCOME_TRY(database.rebuildIndexes());

    } else if (command.name == "erase") {
      if (args.empty()) {
        return ringstore::app::Configurator::Error::CliArgsParseFailed;
      }
      auto ring = database.findRing(args.front());
      if (ring == nullptr) {
        return DatabaseError::RING_NOT_FOUND;
      }
      OUTCOME_TRY(ring->erase());

    } else {
      return ringstore::app::Configurator::Error::CliArgsParseFailed;
    }
    return outcome::success();
  }

  int run_command(std::shared_ptr<LoggingSystem> logsys,
                  std::shared_ptr<Configuration> appcfg) {
    auto logger = logsys->getLogger("Main", ringstore::log::group::app);
    auto io_context = std::make_shared<boost::asio::io_context>();
    auto context = std::make_shared<ringstore::db::Context>(
        logsys, io_context, appcfg->flushDelay());

    Database database(context);
    if (auto res = database.open(appcfg->database()); res.has_error()) {
      SL_CRITICAL(logger, "Failed to open database: {}", res.error());
      return EXIT_FAILURE;
    }

    const auto &command = appcfg->command();
    SL_DEBUG(logger, "Command '{}'", command.name);
    auto res = execute(database, command);
    if (res.has_error()) {
      SL_ERROR(logger, "Command '{}' failed: {}", command.name, res.error());
    }

    // index propagation, then every block flushed before exit
    io_context->poll();
    auto flushed = database.flush();
    io_context->run();
    if (flushed.has_error()) {
      SL_CRITICAL(logger, "Failed to flush database: {}", flushed.error());
      return EXIT_FAILURE;
    }

    logger->flush();
    return res.has_error() ? EXIT_FAILURE : EXIT_SUCCESS;
  }

}  // namespace

int main(int argc, const char **argv, const char **env) {
  setlinebuf(stdout);
  setlinebuf(stderr);

  soralog::util::setThreadName("ringstore");

  qtils::FinalAction flush_std_streams_at_exit([] {
    std::cout.flush();
    std::cerr.flush();
  });

  if (argc <= 1) {
    // Run without arguments
    wrong_usage();
    return EXIT_FAILURE;
  }

  auto app_configurator =
      std::make_unique<ringstore::app::Configurator>(argc, argv, env);

  // Parse CLI args for help, version and config
  if (auto res = app_configurator->step1(); res.has_value()) {
    if (res.value()) {
      return EXIT_SUCCESS;
    }
  } else {
    return EXIT_FAILURE;
  }

  // Parse remaining args
  if (auto res = app_configurator->step2(); res.has_value()) {
    if (res.value()) {
      return EXIT_SUCCESS;
    }
  } else {
    return EXIT_FAILURE;
  }

  // Setup logging system
  auto logging_system = ({
    auto log_config = app_configurator->getLoggingConfig();
    if (log_config.has_error()) {
      std::cerr << "Logging config is empty.\n";
      return EXIT_FAILURE;
    }

    auto log_configurator = std::make_shared<soralog::ConfiguratorFromYAML>(
        std::shared_ptr<soralog::Configurator>(nullptr), log_config.value());

    auto logging_system =
        std::make_shared<soralog::LoggingSystem>(std::move(log_configurator));

    auto config_result = logging_system->configure();
    if (not config_result.message.empty()) {
      (config_result.has_error ? std::cerr : std::cout)
          << config_result.message << '\n';
    }
    if (config_result.has_error) {
      return EXIT_FAILURE;
    }

    std::make_shared<ringstore::log::LoggingSystem>(std::move(logging_system));
  });

  if (auto res = logging_system->tuneLoggingSystem(
          app_configurator->getLoggingCliArgs());
      res.has_error()) {
    fmt::println(std::cerr, "Bad logging option: {}", res.error());
    return EXIT_FAILURE;
  }

  // Setup config
  auto app_configuration = ({
    auto logger =
        logging_system->getLogger("Configurator", ringstore::log::group::app);

    auto config_res = app_configurator->calculateConfig(logger);
    if (config_res.has_error()) {
      auto error = config_res.error();
      SL_CRITICAL(logger, "Failed to calculate config: {}", error);
      fmt::println(std::cerr, "Failed to calculate config: {}", error);
      fmt::println(std::cerr, "See more details in the log");
      return EXIT_FAILURE;
    }

    config_res.value();
  });

  if (app_configuration->command().name.empty()) {
    wrong_usage();
    return EXIT_FAILURE;
  }

  return run_command(logging_system, app_configuration);
}

// NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)
