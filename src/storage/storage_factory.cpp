/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/storage_factory.hpp"

#include <system_error>

#include "log/formatters/filepath.hpp"
#include "storage/file/json_lines_storage.hpp"
#include "storage/file/yaml_data_storage.hpp"
#include "storage/in_memory/in_memory_storage.hpp"
#include "storage/rocksdb/rocksdb.hpp"
#include "storage/storage_error.hpp"

namespace ringstore::storage {

  namespace {
    template <typename T>
    StorageFactory::Constructor fileConstructor(
        qtils::SharedRef<log::LoggingSystem> logsys) {
      return [logsys](const StorageFactory::Options &options)
                 -> outcome::result<std::unique_ptr<Storage>> {
        auto storage =
            std::make_unique<T>(logsys, options.path, options.validator);
        OUTCOME_TRY(storage->open());
        return storage;
      };
    }
  }  // namespace

  StorageFactory::StorageFactory(qtils::SharedRef<log::LoggingSystem> logsys)
      : logger_{logsys->getLogger("StorageFactory", log::group::storage)} {
    registerFormat("memory",
                   [](const Options &)
                       -> outcome::result<std::unique_ptr<Storage>> {
                     return std::make_unique<InMemoryStorage>();
                   });
    registerFormat("yaml", fileConstructor<YamlDataStorage>(logsys));
    registerFormat("jl", fileConstructor<JsonLinesStorage>(logsys));
    registerFormat(
        "rocksdb",
        [logsys](const Options &options)
            -> outcome::result<std::unique_ptr<Storage>> {
          try {
            return std::make_unique<RocksDbStorage>(logsys, options.path);
          } catch (const std::system_error &e) {
            return e.code();
          }
        });

    extensions_ = {
        {".yaml", "yaml"},
        {".yml", "yaml"},
        {".jl", "jl"},
        {".rocksdb", "rocksdb"},
    };
  }

  void StorageFactory::registerFormat(std::string format,
                                      Constructor constructor) {
    constructors_[std::move(format)] = std::move(constructor);
  }

  std::optional<std::string> StorageFactory::formatOf(
      const std::filesystem::path &path) const {
    if (auto it = extensions_.find(path.extension().string());
        it != extensions_.end()) {
      return it->second;
    }
    return std::nullopt;
  }

  outcome::result<std::unique_ptr<Storage>> StorageFactory::create(
      const StorageSpec &spec, FileStorage::KeyValidator validator) const {
    auto format = spec.format;
    if (format.empty()) {
      format = formatOf(spec.path).value_or("");
    }
    auto it = constructors_.find(format);
    if (it == constructors_.end()) {
      SL_ERROR(logger_,
               "No storage backend for format '{}' (path {})",
               format,
               spec.path);
      return StorageError::UNKNOWN_FORMAT;
    }
    SL_DEBUG(logger_, "Creating {} storage at {}", format, spec.path);
    return it->second(Options{
        .path = spec.path,
        .validator = std::move(validator),
    });
  }

}  // namespace ringstore::storage
