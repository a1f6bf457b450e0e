/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "db/index.hpp"

namespace ringstore::db {

  class IndexMock : public Index {
   public:
    // clang-format off
    MOCK_METHOD(const std::string &, name, (), (const, override));
    MOCK_METHOD(std::shared_ptr<const codec::RecordSchema>, schema, (), (const, override));
    // clang-format on

    MOCK_METHOD(outcome::result<ChangePlan>,
                plan,
                (ObjectId,
                 const std::optional<std::string> &,
                 const std::optional<std::string> &),
                (const, override));
  };

}  // namespace ringstore::db
