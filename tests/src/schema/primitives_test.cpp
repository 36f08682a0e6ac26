#include <gtest/gtest.h>
#include <coffer/schema/primitives.hpp>

TEST(primitives, make_hash32_from_bytes_round_trips) {
  auto input = coffer::schema::bytes_t(32, 0xAB);
  auto hash = coffer::schema::make_hash32(input);
  EXPECT_EQ(hash.size(), 32u);
  EXPECT_EQ(hash[0], 0xAB);
  EXPECT_EQ(hash[31], 0xAB);
}

TEST(primitives, try_make_hash32_decodes_prefixed_hex) {
  auto hash = coffer::schema::try_make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  ASSERT_TRUE(hash.has_value());
  EXPECT_EQ((*hash)[0], 0x01);
  EXPECT_EQ((*hash)[31], 0x20);
}

TEST(primitives, try_make_hash32_rejects_wrong_length_and_bad_digits) {
  EXPECT_FALSE(coffer::schema::try_make_hash32("0102").has_value());
  EXPECT_FALSE(coffer::schema::try_make_hash32(std::string(64, 'z')).has_value());
}

TEST(primitives, to_hex_is_lowercase_and_reverses_from_hex) {
  auto payload = coffer::schema::bytes_t{0x00, 0x0F, 0xA0, 0xFF};
  auto hex = coffer::schema::to_hex(payload);
  EXPECT_EQ(hex, "000fa0ff");
  EXPECT_EQ(coffer::schema::from_hex("000FA0FF"), payload);
}

TEST(primitives, try_from_hex_rejects_odd_length) {
  EXPECT_FALSE(coffer::schema::try_from_hex("abc").has_value());
}

TEST(primitives, system_program_id_is_zero_hash) {
  EXPECT_EQ(coffer::schema::kSystemProgramId, coffer::schema::make_zero_hash());
}
