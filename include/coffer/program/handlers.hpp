#pragma once

#include <coffer/program/account_info.hpp>
#include <coffer/program/system_interface.hpp>
#include <coffer/schema/instruction.hpp>
#include <coffer/schema/primitives.hpp>
#include <coffer/schema/program_result.hpp>

#include <span>

// Every handler expects accounts in the order
//   0. [signer, writable] authority
//   1. [writable]         vault, the derived address ("vault", authority, bump)
//   2. []                 system program
namespace coffer::program {

inline constexpr auto kAuthorityAccountIndex = std::size_t{0};
inline constexpr auto kVaultAccountIndex = std::size_t{1};
inline constexpr auto kSystemProgramAccountIndex = std::size_t{2};
inline constexpr auto kVaultAccountCount = std::size_t{3};

/// Allocate the authority's vault at its derived address and write a fresh
/// record with a zero balance.
coffer::schema::program_result_t create_vault(
    const coffer::schema::address_t& program_id,
    std::span<account_info> accounts,
    const coffer::schema::create_vault_t& instruction,
    system_interface& system);

/// Move lamports from the authority into its vault and record them.
coffer::schema::program_result_t credit_vault(
    const coffer::schema::address_t& program_id,
    std::span<account_info> accounts,
    const coffer::schema::credit_vault_t& instruction,
    system_interface& system);

/// Return recorded lamports from the vault to its authority.
coffer::schema::program_result_t debit_vault(
    const coffer::schema::address_t& program_id,
    std::span<account_info> accounts,
    const coffer::schema::debit_vault_t& instruction,
    system_interface& system);

}  // namespace coffer::program
