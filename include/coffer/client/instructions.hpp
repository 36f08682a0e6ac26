#pragma once

#include <coffer/crypto/keypair.hpp>
#include <coffer/ledger/transaction.hpp>
#include <coffer/schema/primitives.hpp>

#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

namespace coffer::client {

inline constexpr auto kDefaultProgramName = std::string_view{"coffer.vault"};

/// Program id of a named deployment, `blake3(name)`.
coffer::schema::address_t make_program_id(
    std::string_view name = kDefaultProgramName);

/// Vault address of `authority` and the bump that derives it.
std::pair<coffer::schema::address_t, uint8_t> vault_address(
    const coffer::schema::address_t& authority,
    const coffer::schema::address_t& program_id);

coffer::ledger::instruction_call_t make_create_vault_instruction(
    const coffer::schema::address_t& program_id,
    const coffer::schema::address_t& authority,
    const coffer::schema::address_t& vault,
    uint8_t bump);

coffer::ledger::instruction_call_t make_credit_vault_instruction(
    const coffer::schema::address_t& program_id,
    const coffer::schema::address_t& authority,
    const coffer::schema::address_t& vault,
    coffer::schema::lamports_t amount);

coffer::ledger::instruction_call_t make_debit_vault_instruction(
    const coffer::schema::address_t& program_id,
    const coffer::schema::address_t& authority,
    const coffer::schema::address_t& vault,
    coffer::schema::lamports_t amount,
    uint8_t bump);

/// Build a message paid by the first of `signers` and sign it with each of
/// them.
coffer::ledger::transaction_t make_transaction(
    std::vector<coffer::ledger::instruction_call_t> instructions,
    const coffer::schema::hash32_t& recent_blockhash,
    const std::vector<coffer::crypto::keypair_t>& signers);

}  // namespace coffer::client
