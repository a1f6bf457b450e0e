/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "testutil/storage/base_rocksdb_test.hpp"

namespace test {

  void BaseRocksDB_Test::open() {
    db_.reset();
    ASSERT_NO_THROW(
        db_ = std::make_shared<RocksDB>(logsys, getPathString() + "/db"));
    ASSERT_TRUE(db_) << "BaseRocksDB_Test: db is nullptr";
  }

  BaseRocksDB_Test::BaseRocksDB_Test(fs::path path)
      : BaseFS_Test(std::move(path)) {}

  void BaseRocksDB_Test::SetUp() {
    BaseFS_Test::SetUp();
    logsys = testutil::prepareLoggers();
    open();
  }

  void BaseRocksDB_Test::TearDown() {
    db_.reset();
    clear();
  }

}  // namespace test
