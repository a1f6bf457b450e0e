/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <fmt/format.h>
#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "db/database.hpp"
#include "db/database_error.hpp"
#include "serde/json.hpp"
#include "testutil/storage/base_fs_test.hpp"

using ringstore::codec::FieldType;
using ringstore::codec::FieldValue;
using ringstore::db::Context;
using ringstore::db::Database;
using ringstore::db::DatabaseConfig;
using ringstore::db::DatabaseError;
using ringstore::db::Edit;
using ringstore::db::EditError;
using ringstore::db::IndexConfig;
using ringstore::db::ObjectId;
using ringstore::db::Ring;
using ringstore::db::RingConfig;
namespace json = ringstore::json;

class DatabaseTest : public test::BaseFS_Test {
 public:
  DatabaseTest() : test::BaseFS_Test("/tmp/ringstore-test-database") {}

  void SetUp() override {
    BaseFS_Test::SetUp();

    // objects of the archive are written before it becomes read-only
    auto seed = std::make_shared<Ring>(ctx, archiveConfig(false));
    ASSERT_OUTCOME_SUCCESS(seed->open());
    ASSERT_OUTCOME_SUCCESS(seed->save(50, R"({"name":"old","age":1})"));
    ASSERT_OUTCOME_SUCCESS(seed->save(60, R"({"name":"kept","age":7})"));
    ASSERT_OUTCOME_SUCCESS(seed->flush());
  }

  RingConfig archiveConfig(bool readonly) const {
    return {
        .name = "archive",
        .data = {.path = base_path / "archive.yaml"},
        .range = {.start = 0, .stop = 100, .readonly = readonly},
    };
  }

  DatabaseConfig twoRings() const {
    return {
        .rings = {archiveConfig(true),
                  {.name = "live",
                   .data = {.format = "memory"},
                   .range = {.start = 100}}},
        .indexes = {{
            .name = "by_name",
            .key = {{.name = "name", .type = FieldType::string()},
                    {.name = "id", .type = FieldType::unsignedInt()}},
            .payload = {"age"},
        }},
    };
  }

  std::unique_ptr<Database> openDatabase(const DatabaseConfig &config) {
    auto db = std::make_unique<Database>(ctx);
    EXPECT_OUTCOME_SUCCESS(db->open(config));
    return db;
  }

  static int64_t ageOf(const std::string &data) {
    auto object = json::parse(data);
    EXPECT_TRUE(object.has_value());
    return object.value()["age"].GetInt64();
  }

  std::shared_ptr<boost::asio::io_context> io_context =
      std::make_shared<boost::asio::io_context>();
  std::shared_ptr<Context> ctx =
      std::make_shared<Context>(testutil::prepareLoggers(),
                                io_context,
                                std::chrono::milliseconds::zero());
};

/**
 * @given read-only archive below a live ring starting at 100
 * @when insert a new object
 * @then it gets the first id of the live ring
 */
TEST_F(DatabaseTest, InsertGoesToTop) {
  auto db = openDatabase(twoRings());
  ASSERT_EQ(db->ringCount(), 2);
  EXPECT_EQ(db->top()->name(), "live");
  EXPECT_EQ(db->bottom()->name(), "archive");

  ASSERT_OUTCOME_SUCCESS(id, db->insert(R"({"name":"new"})"));
  EXPECT_EQ(id, 100);
  ASSERT_OUTCOME_SUCCESS(ring, db->findRingHolding(id));
  EXPECT_EQ(ring->name(), "live");
}

/**
 * @given object 50 stored in the read-only archive
 * @when update it
 * @then the new value is saved to the live ring and shadows the old one
 */
TEST_F(DatabaseTest, UpdateOfReadOnlyObjectSavedAbove) {
  auto db = openDatabase(twoRings());
  ASSERT_OUTCOME_SUCCESS(updated, db->update(50, {Edit::set("age", "2")}));
  EXPECT_EQ(ageOf(updated), 2);

  ASSERT_OUTCOME_SUCCESS(holder, db->findRingHolding(50));
  EXPECT_EQ(holder->name(), "live");
  ASSERT_OUTCOME_SUCCESS(archived, db->findRing("archive")->select(50));
  ASSERT_TRUE(archived.has_value());
  EXPECT_EQ(ageOf(*archived), 1);

  ASSERT_OUTCOME_SUCCESS(selected, db->select(50));
  EXPECT_EQ(ageOf(selected), 2);

  ASSERT_OUTCOME_SUCCESS(objects, db->scan());
  ASSERT_EQ(objects.size(), 2);
  EXPECT_EQ(objects[0].first, 50);
  EXPECT_EQ(ageOf(objects[0].second), 2);
  EXPECT_EQ(objects[1].first, 60);

  EXPECT_OUTCOME_ERROR(db->update(70, {Edit::set("age", "2")}),
                       DatabaseError::NOT_FOUND);
}

/**
 * @given shadow copy of an archived object in the live ring
 * @when delete the object repeatedly
 * @then the shadow is removed first, then the archived object is read-only
 */
TEST_F(DatabaseTest, Delete) {
  auto db = openDatabase(twoRings());
  ASSERT_OUTCOME_SUCCESS(db->update(50, {Edit::set("age", "3")}));

  ASSERT_OUTCOME_SUCCESS(removed, db->remove(50));
  EXPECT_TRUE(removed);
  ASSERT_OUTCOME_SUCCESS(restored, db->select(50));
  EXPECT_EQ(ageOf(restored), 1);
  EXPECT_OUTCOME_ERROR(db->remove(50), DatabaseError::READ_ONLY);

  ASSERT_OUTCOME_SUCCESS(absent, db->remove(500));
  EXPECT_FALSE(absent);
  ASSERT_OUTCOME_SUCCESS(again, db->remove(500));
  EXPECT_FALSE(again);

  EXPECT_OUTCOME_ERROR(db->select(500), DatabaseError::NOT_FOUND);
}

/**
 * @given object 60 in the archive
 * @when insert explicit ids
 * @then existing ids are rejected and new ones land in the ring owning them
 */
TEST_F(DatabaseTest, ExplicitIds) {
  auto db = openDatabase(twoRings());
  EXPECT_OUTCOME_ERROR(db->insert(60, "{}"), DatabaseError::DUPLICATE_ID);
  EXPECT_OUTCOME_ERROR(db->insert(61, "{}"), DatabaseError::ID_OUT_OF_RANGE);

  ASSERT_OUTCOME_SUCCESS(id, db->insert(150, "{}"));
  EXPECT_EQ(id, 150);
  EXPECT_OUTCOME_ERROR(db->insert(150, "{}"), DatabaseError::DUPLICATE_ID);

  EXPECT_OUTCOME_ERROR(
      db->insert(60, "{}", {.ring = "live", .global_unique = true}),
      DatabaseError::DUPLICATE_ID);
  EXPECT_OUTCOME_ERROR(db->insert("{}", {.ring = "nope"}),
                       DatabaseError::RING_NOT_FOUND);
}

/**
 * @given writable base ring for ids below 100 under a live ring from 100
 * @when insert an id owned by the base ring and update it
 * @then the insert is forwarded down and the update stays in the base ring
 */
TEST_F(DatabaseTest, LowerWritableRing) {
  auto db = openDatabase(
      {.rings = {{.name = "base",
                  .data = {.format = "memory"},
                  .range = {.start = 0, .stop = 100}},
                 {.name = "live",
                  .data = {.format = "memory"},
                  .range = {.start = 100}}}});

  ASSERT_OUTCOME_SUCCESS(id, db->insert(5, R"({"age":1})"));
  EXPECT_EQ(id, 5);
  ASSERT_OUTCOME_SUCCESS(holder, db->findRingHolding(5));
  EXPECT_EQ(holder->name(), "base");

  ASSERT_OUTCOME_SUCCESS(updated, db->update(5, {Edit::set("age", "4")}));
  EXPECT_EQ(ageOf(updated), 4);
  ASSERT_OUTCOME_SUCCESS(in_live, db->findRing("live")->select(5));
  EXPECT_FALSE(in_live.has_value());
  ASSERT_OUTCOME_SUCCESS(in_base, db->findRing("base")->select(5));
  ASSERT_TRUE(in_base.has_value());
  EXPECT_EQ(ageOf(*in_base), 4);

  ASSERT_OUTCOME_SUCCESS(auto_id, db->insert(R"({"age":2})"));
  EXPECT_EQ(auto_id, 100);
}

/**
 * @given object data which is not JSON
 * @when insert it
 * @then INVALID_JSON is returned and nothing is stored
 */
TEST_F(DatabaseTest, RejectsMalformedData) {
  auto db = openDatabase(twoRings());
  EXPECT_OUTCOME_ERROR(db->insert("not json"), EditError::INVALID_JSON);
  ASSERT_OUTCOME_SUCCESS(objects, db->scan(100));
  EXPECT_TRUE(objects.empty());
}

/**
 * @given databases without a ring accepting the insert
 * @when insert objects
 * @then NO_WRITABLE_RING or ID_OUT_OF_RANGE is returned
 */
TEST_F(DatabaseTest, NoRingAccepts) {
  auto readonly = openDatabase({.rings = {archiveConfig(true)}});
  EXPECT_OUTCOME_ERROR(readonly->insert("{}"), DatabaseError::NO_WRITABLE_RING);

  Database bounded{ctx};
  ASSERT_OUTCOME_SUCCESS(bounded.open(
      {.rings = {{.name = "small",
                  .data = {.format = "memory"},
                  .range = {.start = 10, .stop = 11}}}}));
  ASSERT_OUTCOME_SUCCESS(bounded.insert("{}"));
  EXPECT_OUTCOME_ERROR(bounded.insert("{}"), DatabaseError::ID_OUT_OF_RANGE);
  EXPECT_OUTCOME_ERROR(bounded.insert(20, "{}"),
                       DatabaseError::ID_OUT_OF_RANGE);
}

/**
 * @given rings with indexed objects
 * @when scan the index with bounds, offset and limit
 * @then records of all rings come merged in key order
 */
TEST_F(DatabaseTest, ScanIndex) {
  auto db = openDatabase(twoRings());
  for (auto name : {"alpha", "beta", "gamma", "kappa"}) {
    ASSERT_OUTCOME_SUCCESS(
        db->insert(fmt::format(R"({{"name":"{}","age":1}})", name)));
  }
  io_context->run();

  ASSERT_OUTCOME_SUCCESS(all, db->scanIndex("by_name"));
  ASSERT_EQ(all.size(), 6);

  ASSERT_OUTCOME_SUCCESS(
      page,
      db->scanIndex("by_name",
                    {.start = {std::string{"b"}},
                     .stop = {std::string{"l"}},
                     .offset = 1,
                     .limit = 2}));
  ASSERT_EQ(page.size(), 2);
  ASSERT_OUTCOME_SUCCESS(first, page[0].fields());
  EXPECT_EQ(first[0], FieldValue{std::string{"gamma"}});
  ASSERT_OUTCOME_SUCCESS(second, page[1].fields());
  EXPECT_EQ(second[0], FieldValue{std::string{"kappa"}});
  EXPECT_EQ(page[1].value(), "1");

  EXPECT_OUTCOME_ERROR(db->scanIndex("other"), DatabaseError::INDEX_NOT_FOUND);
}

/**
 * @given opened database
 * @when append rings which are not opened or already present
 * @then they are refused
 */
TEST_F(DatabaseTest, Append) {
  auto db = openDatabase(twoRings());
  auto closed = std::make_shared<Ring>(
      ctx, RingConfig{.name = "new", .data = {.format = "memory"}});
  EXPECT_OUTCOME_ERROR(db->append(closed), DatabaseError::RING_NOT_OPEN);

  auto duplicate = std::make_shared<Ring>(
      ctx, RingConfig{.name = "live", .data = {.format = "memory"}});
  ASSERT_OUTCOME_SUCCESS(duplicate->open());
  EXPECT_OUTCOME_ERROR(db->append(duplicate), DatabaseError::DUPLICATE_RING);

  ASSERT_OUTCOME_SUCCESS(closed->open());
  ASSERT_OUTCOME_SUCCESS(db->append(closed));
  EXPECT_EQ(db->top()->name(), "new");
  EXPECT_EQ(db->top()->prev(), 1);
  EXPECT_EQ(db->findRing("live")->next(), 2);
}

/**
 * @given observer subscribed to the database
 * @when objects change in different rings
 * @then every change is reported with the ring that stored it
 */
TEST_F(DatabaseTest, Observer) {
  auto db = openDatabase(twoRings());
  std::vector<std::pair<std::string, ObjectId>> changes;
  db->subscribe([&](const std::string &ring,
                    ObjectId id,
                    const std::optional<std::string> &,
                    const std::optional<std::string> &) {
    changes.emplace_back(ring, id);
  });

  ASSERT_OUTCOME_SUCCESS(id, db->insert("{}"));
  ASSERT_OUTCOME_SUCCESS(db->update(60, {Edit::set("age", "8")}));
  ASSERT_OUTCOME_SUCCESS(db->remove(id));
  io_context->run();

  ASSERT_EQ(changes.size(), 3);
  EXPECT_EQ(changes[0], (std::pair<std::string, ObjectId>{"live", id}));
  EXPECT_EQ(changes[1], (std::pair<std::string, ObjectId>{"live", 60}));
  EXPECT_EQ(changes[2].second, id);
}

/**
 * @given observer which reads and edits the database
 * @when an object changes
 * @then the observer runs after the change completed and its own edit is
 * applied
 */
TEST_F(DatabaseTest, ObserverCallsBack) {
  auto db = openDatabase(twoRings());
  std::vector<std::string> seen;
  db->subscribe([&](const std::string &,
                    ObjectId id,
                    const std::optional<std::string> &,
                    const std::optional<std::string> &next) {
    if (not next.has_value()) {
      return;
    }
    auto data = db->select(id);
    ASSERT_TRUE(data.has_value());
    seen.emplace_back(data.value());
    if (ageOf(data.value()) < 3) {
      ASSERT_TRUE(db->update(id, {Edit::set("age", "3")}).has_value());
    }
  });

  ASSERT_OUTCOME_SUCCESS(id, db->insert(R"({"name":"x","age":1})"));
  io_context->run();

  ASSERT_EQ(seen.size(), 2);
  ASSERT_OUTCOME_SUCCESS(data, db->select(id));
  EXPECT_EQ(ageOf(data), 3);
}
