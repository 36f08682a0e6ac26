#include <gtest/gtest.h>
#include <coffer/program/checks.hpp>
#include <coffer/testing/common.hpp>

#include <vector>

namespace {

using coffer::program::account_info;
using coffer::schema::account_t;
using coffer::schema::failed_with;
using coffer::schema::program_error_code;
using coffer::schema::succeeded;

}  // namespace

TEST(checks, require_signer_reports_missing_signature) {
  auto account = account_t{};
  const auto key = coffer::testing::make_address(1);
  EXPECT_TRUE(succeeded(
      coffer::program::require_signer(account_info{key, account, true, false})));

  auto result =
      coffer::program::require_signer(account_info{key, account, false, true});
  EXPECT_TRUE(failed_with(result, program_error_code::missing_required_signature));
  EXPECT_EQ(result.codespace, coffer::schema::kProgramCodespace);
  EXPECT_NE(result.log.find(coffer::schema::to_hex(key)), std::string::npos);
}

TEST(checks, require_owned_by_compares_owner) {
  const auto program_id = coffer::testing::make_address(50);
  auto owned = account_t{.lamports = 1, .owner = program_id};
  auto foreign = account_t{.lamports = 1,
                           .owner = coffer::testing::make_address(60)};
  const auto key = coffer::testing::make_address(2);

  EXPECT_TRUE(succeeded(coffer::program::require_owned_by(
      account_info{key, owned, false, true}, program_id)));
  EXPECT_TRUE(failed_with(coffer::program::require_owned_by(
                              account_info{key, foreign, false, true},
                              program_id),
                          program_error_code::illegal_owner));
}

TEST(checks, require_writable_rejects_read_only) {
  auto account = account_t{};
  const auto key = coffer::testing::make_address(3);
  EXPECT_TRUE(failed_with(coffer::program::require_writable(
                              account_info{key, account, true, false}),
                          program_error_code::immutable_account));
  EXPECT_TRUE(succeeded(coffer::program::require_writable(
      account_info{key, account, false, true})));
}

TEST(checks, require_system_program_matches_zero_address) {
  auto account = account_t{};
  EXPECT_TRUE(succeeded(coffer::program::require_system_program(
      account_info{coffer::schema::kSystemProgramId, account, false, false})));
  EXPECT_TRUE(failed_with(coffer::program::require_system_program(account_info{
                              coffer::testing::make_address(4), account, false,
                              false}),
                          program_error_code::incorrect_program_id));
}

TEST(checks, require_account_count_counts_handles) {
  auto account = account_t{};
  auto accounts = std::vector<account_info>{
      account_info{coffer::testing::make_address(5), account, true, true},
      account_info{coffer::testing::make_address(6), account, false, true}};
  EXPECT_TRUE(succeeded(coffer::program::require_account_count(accounts, 2)));
  EXPECT_TRUE(
      failed_with(coffer::program::require_account_count(accounts, 3),
                  program_error_code::not_enough_account_keys));
}
