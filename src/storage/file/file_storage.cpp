/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/file/file_storage.hpp"

#include <fstream>

#include "log/formatters/filepath.hpp"
#include "storage/storage_error.hpp"

namespace ringstore::storage {
  namespace fs = std::filesystem;

  FileStorage::FileStorage(qtils::SharedRef<log::LoggingSystem> logsys,
                           fs::path path,
                           KeyValidator validator)
      : logger_{logsys->getLogger("FileStorage", log::group::storage)},
        path_{std::move(path)},
        validator_{std::move(validator)} {}

  outcome::result<void> FileStorage::open() {
    std::error_code ec;
    if (not fs::exists(path_, ec)) {
      SL_DEBUG(logger_, "File {} does not exist; storage is empty", path_);
      return outcome::success();
    }

    std::ifstream in{path_};
    if (not in) {
      SL_ERROR(logger_, "Can't open file {}", path_);
      return StorageError::IO_ERROR;
    }

    auto entries_res = parse(in);
    if (entries_res.has_error()) {
      SL_ERROR(logger_, "Can't load {}: {}", path_, entries_res.error());
      return entries_res.as_failure();
    }

    for (auto &[key, value] : entries_res.value()) {
      if (validator_ and not validator_(key)) {
        SL_ERROR(
            logger_, "Key {} in {} is out of allowed range", key.toHex(), path_);
        return StorageError::KEY_OUT_OF_RANGE;
      }
      OUTCOME_TRY(found, contains(key));
      if (found) {
        SL_ERROR(logger_, "Duplicate key {} in {}", key.toHex(), path_);
        return StorageError::DUPLICATE_KEY;
      }
      OUTCOME_TRY(put(key, std::move(value)));
    }

    SL_VERBOSE(logger_, "Loaded {} records from {}", size(), path_);
    return outcome::success();
  }

  outcome::result<void> FileStorage::flush() {
    std::error_code ec;
    if (path_.has_parent_path()) {
      fs::create_directories(path_.parent_path(), ec);
      if (ec) {
        SL_ERROR(logger_, "Can't create directory for {}: {}", path_, ec);
        return StorageError::DB_PATH_NOT_CREATED;
      }
    }

    OUTCOME_TRY(entries, scan(std::nullopt, std::nullopt));

    auto tmp_path = path_;
    tmp_path += ".tmp";
    {
      std::ofstream out{tmp_path, std::ios::trunc};
      if (not out) {
        SL_ERROR(logger_, "Can't write file {}", tmp_path);
        return StorageError::IO_ERROR;
      }
      OUTCOME_TRY(serialize(out, entries));
      out.flush();
      if (not out) {
        SL_ERROR(logger_, "Write to {} failed", tmp_path);
        return StorageError::IO_ERROR;
      }
    }

    fs::rename(tmp_path, path_, ec);
    if (ec) {
      SL_ERROR(logger_, "Can't replace {}: {}", path_, ec);
      return StorageError::IO_ERROR;
    }

    SL_DEBUG(logger_, "Flushed {} records to {}", entries.size(), path_);
    return outcome::success();
  }

}  // namespace ringstore::storage
