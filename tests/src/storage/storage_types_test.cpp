#include <coffer/common/critical.hpp>
#include <coffer/schema/encoding/scale/encoder.hpp>
#include <coffer/storage/rocksdb/storage.hpp>
#include <coffer/storage/storage.hpp>
#include <coffer/testing/common.hpp>
#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace {

using encoder_t = coffer::schema::encoding::encoder<
    coffer::schema::encoding::scale_encoder_tag>;

coffer::schema::bytes_t make_key(const std::string_view key) {
  return coffer::schema::make_bytes(key);
}

}  // namespace

TEST(storage_types, defaults_are_stable) {
  auto entry = coffer::storage::key_value_entry_t{};
  EXPECT_TRUE(entry.first.empty());
  EXPECT_TRUE(entry.second.empty());
}

TEST(storage_types, put_get_round_trips_encoded_rows) {
  auto db = coffer::testing::make_db_path("coffer_storage_put_get");
  {
    auto storage =
        coffer::storage::make_storage<coffer::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    using row_t = std::tuple<uint64_t, coffer::schema::address_t>;

    const auto key = make_key("ROW|1");
    const auto row = row_t{42, coffer::testing::make_address(5)};
    storage.put(encoder, coffer::schema::make_bytes_view(key), row);

    auto loaded =
        storage.get<row_t>(encoder, coffer::schema::make_bytes_view(key));
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, row);

    const auto missing = make_key("ROW|2");
    EXPECT_FALSE(
        storage.get<row_t>(encoder, coffer::schema::make_bytes_view(missing))
            .has_value());
  }
  coffer::testing::remove_path(db);
}

TEST(storage_types, put_batch_writes_every_entry) {
  auto db = coffer::testing::make_db_path("coffer_storage_batch");
  {
    auto storage =
        coffer::storage::make_storage<coffer::storage::rocksdb_storage_tag>(db);
    storage.put_batch({{make_key("A|1"), {0x01}},
                       {make_key("A|2"), {0x02}},
                       {make_key("B|1"), {0x03}}});

    auto rows = storage.list_by_prefix(
        coffer::schema::make_bytes_view(std::string_view{"A|"}));
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].first, make_key("A|1"));
    EXPECT_EQ(rows[0].second, coffer::schema::bytes_t{0x01});
    EXPECT_EQ(rows[1].first, make_key("A|2"));
    EXPECT_EQ(rows[1].second, coffer::schema::bytes_t{0x02});
  }
  coffer::testing::remove_path(db);
}

TEST(storage_types, list_by_prefix_returns_nothing_for_unknown_prefix) {
  auto db = coffer::testing::make_db_path("coffer_storage_prefix");
  {
    auto storage =
        coffer::storage::make_storage<coffer::storage::rocksdb_storage_tag>(db);
    storage.put_batch({{make_key("A|1"), {0x01}}});
    EXPECT_TRUE(storage
                    .list_by_prefix(coffer::schema::make_bytes_view(
                        std::string_view{"Z|"}))
                    .empty());
  }
  coffer::testing::remove_path(db);
}

TEST(storage_types, data_survives_reopen) {
  auto db = coffer::testing::make_db_path("coffer_storage_reopen");
  {
    auto storage =
        coffer::storage::make_storage<coffer::storage::rocksdb_storage_tag>(db);
    storage.put_batch({{make_key("K"), {0xAA, 0xBB}}});
  }
  {
    auto storage =
        coffer::storage::make_storage<coffer::storage::rocksdb_storage_tag>(db);
    auto rows = storage.list_by_prefix(
        coffer::schema::make_bytes_view(std::string_view{"K"}));
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].second, (coffer::schema::bytes_t{0xAA, 0xBB}));
  }
  coffer::testing::remove_path(db);
}

TEST(storage_types_death, opening_a_held_store_exits) {
  auto db = coffer::testing::make_db_path("coffer_storage_held");
  {
    auto storage =
        coffer::storage::make_storage<coffer::storage::rocksdb_storage_tag>(db);
    EXPECT_EXIT(
        coffer::storage::make_storage<coffer::storage::rocksdb_storage_tag>(
            db),
        ::testing::ExitedWithCode(coffer::common::kCriticalExitStatus), "");
  }
  coffer::testing::remove_path(db);
}
