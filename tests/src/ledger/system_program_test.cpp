#include <coffer/ledger/derivation.hpp>
#include <coffer/ledger/system_program.hpp>
#include <coffer/testing/common.hpp>
#include <gtest/gtest.h>

#include <array>
#include <limits>

namespace {

using coffer::program::account_info;
using coffer::program::seeds_t;
using coffer::program::signer_seeds_t;
using coffer::schema::account_t;
using coffer::schema::failed_with;
using coffer::schema::program_error_code;
using coffer::schema::succeeded;

}  // namespace

TEST(system_program, minimum_balance_follows_rent_parameters) {
  const auto options = coffer::ledger::ledger_options{};
  EXPECT_EQ(coffer::ledger::minimum_balance(48, options), 1'224'960u);
  EXPECT_EQ(coffer::ledger::minimum_balance(0, options), 128u * 3480u * 2u);

  auto system = coffer::ledger::make_system_interface(
      coffer::testing::make_address(1), options);
  EXPECT_EQ(system.minimum_balance(48), 1'224'960u);
}

TEST(system_program, transfer_moves_lamports_between_writable_accounts) {
  auto system = coffer::ledger::make_system_interface(
      coffer::testing::make_address(1), {});
  auto from = account_t{.lamports = 100};
  auto to = account_t{.lamports = 5};
  auto from_info = account_info{coffer::testing::make_address(2), from, true, true};
  auto to_info = account_info{coffer::testing::make_address(3), to, false, true};

  EXPECT_TRUE(succeeded(system.transfer(from_info, to_info, 60, {})));
  EXPECT_EQ(from.lamports, 40u);
  EXPECT_EQ(to.lamports, 65u);

  EXPECT_TRUE(failed_with(system.transfer(from_info, to_info, 41, {}),
                          program_error_code::insufficient_lamports));
  EXPECT_EQ(from.lamports, 40u);
}

TEST(system_program, transfer_rejects_unauthorized_and_read_only) {
  auto system = coffer::ledger::make_system_interface(
      coffer::testing::make_address(1), {});
  auto from = account_t{.lamports = 100};
  auto to = account_t{};

  auto unsigned_from =
      account_info{coffer::testing::make_address(2), from, false, true};
  auto to_info = account_info{coffer::testing::make_address(3), to, false, true};
  EXPECT_TRUE(failed_with(system.transfer(unsigned_from, to_info, 1, {}),
                          program_error_code::missing_required_signature));

  auto signed_from =
      account_info{coffer::testing::make_address(2), from, true, true};
  auto read_only_to =
      account_info{coffer::testing::make_address(3), to, false, false};
  EXPECT_TRUE(failed_with(system.transfer(signed_from, read_only_to, 1, {}),
                          program_error_code::immutable_account));
  EXPECT_EQ(from.lamports, 100u);
}

TEST(system_program, transfer_rejects_destination_overflow) {
  auto system = coffer::ledger::make_system_interface(
      coffer::testing::make_address(1), {});
  auto from = account_t{.lamports = 10};
  auto to = account_t{
      .lamports = std::numeric_limits<coffer::schema::lamports_t>::max()};
  auto from_info = account_info{coffer::testing::make_address(2), from, true, true};
  auto to_info = account_info{coffer::testing::make_address(3), to, false, true};

  EXPECT_TRUE(failed_with(system.transfer(from_info, to_info, 1, {}),
                          program_error_code::arithmetic_overflow));
}

TEST(system_program, seeds_authorize_derived_source_for_calling_program) {
  const auto program_id = coffer::testing::make_address(1);
  auto system = coffer::ledger::make_system_interface(program_id, {});

  const auto seed = std::array<uint8_t, 4>{'p', 'o', 'o', 'l'};
  const auto seeds = seeds_t{coffer::schema::bytes_view_t{seed}};
  const auto derived = *coffer::ledger::derive_address(seeds, program_id);

  auto pool = account_t{.lamports = 50, .owner = program_id};
  auto user = account_t{};
  auto pool_info = account_info{derived, pool, false, true};
  auto user_info = account_info{coffer::testing::make_address(9), user, false, true};

  EXPECT_TRUE(failed_with(system.transfer(pool_info, user_info, 10, {}),
                          program_error_code::missing_required_signature));
  EXPECT_TRUE(succeeded(
      system.transfer(pool_info, user_info, 10, signer_seeds_t{seeds})));
  EXPECT_EQ(pool.lamports, 40u);
  EXPECT_EQ(user.lamports, 10u);

  // The same seeds under another program derive another address.
  auto other = coffer::ledger::make_system_interface(
      coffer::testing::make_address(2), {});
  EXPECT_TRUE(failed_with(
      other.transfer(pool_info, user_info, 10, signer_seeds_t{seeds}),
      program_error_code::missing_required_signature));
}

TEST(system_program, create_account_allocates_owned_zeroed_data) {
  const auto program_id = coffer::testing::make_address(1);
  auto system = coffer::ledger::make_system_interface(program_id, {});
  auto funder = account_t{.lamports = 1'000};
  auto target = account_t{};
  auto funder_info =
      account_info{coffer::testing::make_address(2), funder, true, true};
  auto target_info =
      account_info{coffer::testing::make_address(3), target, true, true};

  ASSERT_TRUE(succeeded(system.create_account(funder_info, target_info, 300,
                                              16, program_id, {})));
  EXPECT_EQ(funder.lamports, 700u);
  EXPECT_EQ(target.lamports, 300u);
  EXPECT_EQ(target.owner, program_id);
  EXPECT_EQ(target.data, coffer::schema::bytes_t(16, 0));

  EXPECT_TRUE(failed_with(system.create_account(funder_info, target_info, 300,
                                                16, program_id, {}),
                          program_error_code::account_already_in_use));
}

TEST(system_program, create_account_requires_funds_and_authorization) {
  const auto program_id = coffer::testing::make_address(1);
  auto system = coffer::ledger::make_system_interface(program_id, {});
  auto funder = account_t{.lamports = 10};
  auto target = account_t{};
  auto funder_info =
      account_info{coffer::testing::make_address(2), funder, true, true};

  auto unsigned_target =
      account_info{coffer::testing::make_address(3), target, false, true};
  EXPECT_TRUE(failed_with(system.create_account(funder_info, unsigned_target,
                                                5, 8, program_id, {}),
                          program_error_code::missing_required_signature));

  auto signed_target =
      account_info{coffer::testing::make_address(3), target, true, true};
  EXPECT_TRUE(failed_with(system.create_account(funder_info, signed_target,
                                                11, 8, program_id, {}),
                          program_error_code::insufficient_lamports));
  EXPECT_EQ(target, account_t{});
  EXPECT_EQ(funder.lamports, 10u);
}
