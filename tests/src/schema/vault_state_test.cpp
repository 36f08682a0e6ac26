#include <gtest/gtest.h>
#include <coffer/schema/vault_state.hpp>
#include <coffer/testing/common.hpp>

#include <algorithm>
#include <limits>

namespace {

using coffer::schema::bytes_t;
using coffer::schema::kVaultStateSize;
using coffer::schema::vault_state;

}  // namespace

TEST(vault_state, initialize_writes_discriminator_authority_and_zero_balance) {
  auto data = bytes_t(kVaultStateSize, 0xEE);
  const auto authority = coffer::testing::make_address(7);

  auto state = vault_state::initialize(data, authority);
  ASSERT_TRUE(state.has_value());
  EXPECT_EQ(state->authority(), authority);
  EXPECT_EQ(state->balance(), 0u);

  const auto expected_prefix = bytes_t{0x56, 0x61, 0x75, 0x6c,
                                       0x74, 0x21, 0x21, 0x21};
  EXPECT_TRUE(std::equal(std::begin(expected_prefix),
                         std::end(expected_prefix), std::begin(data)));
  EXPECT_TRUE(std::equal(std::begin(authority), std::end(authority),
                         std::begin(data) + 8));
  EXPECT_TRUE(std::all_of(std::begin(data) + 40, std::end(data),
                          [](const auto byte) { return byte == 0; }));
}

TEST(vault_state, balance_is_little_endian_at_offset_40) {
  auto data = bytes_t(kVaultStateSize, 0);
  auto state = vault_state::initialize(data, coffer::testing::make_address(1));
  ASSERT_TRUE(state.has_value());

  state->set_balance(1'000'000'000);
  EXPECT_EQ(data[40], 0x00);
  EXPECT_EQ(data[41], 0xCA);
  EXPECT_EQ(data[42], 0x9A);
  EXPECT_EQ(data[43], 0x3B);
  EXPECT_EQ(data[44], 0x00);

  auto reloaded = vault_state::load(data);
  ASSERT_TRUE(reloaded.has_value());
  EXPECT_EQ(reloaded->balance(), 1'000'000'000u);
}

TEST(vault_state, load_rejects_wrong_size) {
  auto short_data = bytes_t(kVaultStateSize - 1, 0);
  EXPECT_FALSE(vault_state::load(short_data).has_value());

  auto long_data = bytes_t(kVaultStateSize + 1, 0);
  EXPECT_FALSE(vault_state::load(long_data).has_value());

  auto empty = bytes_t{};
  EXPECT_FALSE(vault_state::load(empty).has_value());
}

TEST(vault_state, load_rejects_foreign_discriminator) {
  auto data = bytes_t(kVaultStateSize, 0);
  ASSERT_TRUE(
      vault_state::initialize(data, coffer::testing::make_address(3))
          .has_value());
  data[7] = 0x00;
  EXPECT_FALSE(vault_state::load(data).has_value());
  EXPECT_FALSE(coffer::schema::read_vault_record(data).has_value());
}

TEST(vault_state, initialize_rejects_wrong_size_without_writing) {
  auto data = bytes_t(16, 0xEE);
  EXPECT_FALSE(
      vault_state::initialize(data, coffer::testing::make_address(4))
          .has_value());
  EXPECT_TRUE(std::all_of(std::begin(data), std::end(data),
                          [](const auto byte) { return byte == 0xEE; }));
}

TEST(vault_state, writes_through_view_are_visible_to_readers) {
  auto data = bytes_t(kVaultStateSize, 0);
  const auto authority = coffer::testing::make_address(9);
  auto state = vault_state::initialize(data, authority);
  ASSERT_TRUE(state.has_value());
  state->set_balance(std::numeric_limits<coffer::schema::lamports_t>::max());

  auto record = coffer::schema::read_vault_record(data);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->authority, authority);
  EXPECT_EQ(record->balance,
            std::numeric_limits<coffer::schema::lamports_t>::max());
}
