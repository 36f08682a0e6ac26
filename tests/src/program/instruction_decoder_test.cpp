#include <gtest/gtest.h>
#include <coffer/program/instruction_decoder.hpp>

#include <string>
#include <variant>
#include <vector>

namespace {

using coffer::program::decode_instruction;
using coffer::schema::bytes_t;

}  // namespace

TEST(instruction_decoder, decodes_create_vault) {
  auto error = std::string{};
  auto decoded = decode_instruction(bytes_t{0x00, 0xFE}, error);
  ASSERT_TRUE(decoded.has_value()) << error;
  ASSERT_TRUE(std::holds_alternative<coffer::schema::create_vault_t>(*decoded));
  EXPECT_EQ(std::get<coffer::schema::create_vault_t>(*decoded).bump, 254u);
}

TEST(instruction_decoder, decodes_credit_amount_little_endian) {
  auto error = std::string{};
  auto decoded = decode_instruction(
      bytes_t{0x01, 0x00, 0xCA, 0x9A, 0x3B, 0x00, 0x00, 0x00, 0x00}, error);
  ASSERT_TRUE(decoded.has_value()) << error;
  ASSERT_TRUE(std::holds_alternative<coffer::schema::credit_vault_t>(*decoded));
  EXPECT_EQ(std::get<coffer::schema::credit_vault_t>(*decoded).amount,
            1'000'000'000u);
}

TEST(instruction_decoder, decodes_debit_amount_and_bump) {
  auto error = std::string{};
  auto decoded = decode_instruction(
      bytes_t{0x02, 0x01, 0x02, 0x00, 0x00, 0x00, 0x00, 0x00, 0x80, 0xFF},
      error);
  ASSERT_TRUE(decoded.has_value()) << error;
  ASSERT_TRUE(std::holds_alternative<coffer::schema::debit_vault_t>(*decoded));
  const auto& debit = std::get<coffer::schema::debit_vault_t>(*decoded);
  EXPECT_EQ(debit.amount, 0x8000000000000201ull);
  EXPECT_EQ(debit.bump, 255u);
  EXPECT_EQ(debit.version, 1u);
}

TEST(instruction_decoder, ignores_trailing_bytes) {
  auto error = std::string{};
  auto decoded = decode_instruction(bytes_t{0x00, 0x07, 0xAA, 0xBB}, error);
  ASSERT_TRUE(decoded.has_value()) << error;
  EXPECT_EQ(*decoded,
            coffer::schema::vault_instruction_t{
                coffer::schema::create_vault_t{.bump = 7}});
}

TEST(instruction_decoder, rejects_empty_payload) {
  auto error = std::string{};
  EXPECT_FALSE(decode_instruction(bytes_t{}, error).has_value());
  EXPECT_FALSE(error.empty());
}

TEST(instruction_decoder, rejects_short_payloads) {
  auto error = std::string{};
  EXPECT_FALSE(decode_instruction(bytes_t{0x00}, error).has_value());
  EXPECT_FALSE(
      decode_instruction(bytes_t{0x01, 0x00, 0x00, 0x00}, error).has_value());
  EXPECT_FALSE(decode_instruction(bytes_t{0x02, 0x01, 0x00, 0x00, 0x00, 0x00,
                                          0x00, 0x00, 0x00},
                                  error)
                   .has_value());
  EXPECT_NE(error.find("debit_vault"), std::string::npos);
}

TEST(instruction_decoder, rejects_unknown_tag) {
  auto error = std::string{};
  EXPECT_FALSE(decode_instruction(bytes_t{0x03, 0x00}, error).has_value());
  EXPECT_NE(error.find("3"), std::string::npos);
}

TEST(instruction_decoder, decoding_is_repeatable_and_leaves_input_untouched) {
  const auto payloads = std::vector<bytes_t>{
      bytes_t{0x00, 0xFE},
      bytes_t{0x01, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF},
      bytes_t{0x02, 0x05, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xFD, 0x01},
      bytes_t{},
      bytes_t{0x02, 0x05},
      bytes_t{0x09, 0x00}};

  for (const auto& payload : payloads) {
    const auto original = payload;
    auto first_error = std::string{};
    auto second_error = std::string{};
    const auto first = decode_instruction(payload, first_error);
    const auto second = decode_instruction(payload, second_error);

    EXPECT_EQ(first, second);
    EXPECT_EQ(first_error, second_error);
    EXPECT_EQ(payload, original);
  }
}
