#include <boost/endian/conversion.hpp>
#include <coffer/blake3/hash.hpp>
#include <coffer/client/instructions.hpp>
#include <coffer/common/critical.hpp>
#include <coffer/ledger/derivation.hpp>
#include <coffer/program/instruction_decoder.hpp>
#include <coffer/program/vault_seeds.hpp>
#include <coffer/schema/instruction.hpp>

using namespace coffer::schema;
using coffer::ledger::account_meta_t;
using coffer::ledger::instruction_call_t;

namespace coffer::client {

namespace {

std::vector<account_meta_t> make_vault_metas(const address_t& authority,
                                             const address_t& vault) {
  return {account_meta_t{.key = authority, .is_signer = true,
                         .is_writable = true},
          account_meta_t{.key = vault, .is_signer = false,
                         .is_writable = true},
          account_meta_t{.key = kSystemProgramId, .is_signer = false,
                         .is_writable = false}};
}

void write_amount(bytes_t& data, const lamports_t amount) {
  boost::endian::endian_store<lamports_t, sizeof(lamports_t),
                              boost::endian::order::little>(data.data() + 1,
                                                            amount);
}

}  // namespace

address_t make_program_id(const std::string_view name) {
  return coffer::blake3::hash(name);
}

std::pair<address_t, uint8_t> vault_address(const address_t& authority,
                                            const address_t& program_id) {
  auto found = coffer::ledger::find_program_address(
      coffer::program::make_vault_seeds(authority), program_id);
  if (!found) {
    coffer::common::critical("no bump derives a vault address");
  }
  return *found;
}

instruction_call_t make_create_vault_instruction(const address_t& program_id,
                                                 const address_t& authority,
                                                 const address_t& vault,
                                                 const uint8_t bump) {
  auto data = bytes_t(coffer::program::kCreateVaultInstructionSize, 0);
  data[0] = static_cast<uint8_t>(instruction_tag_t::create_vault);
  data[1] = bump;
  return instruction_call_t{.program_id = program_id,
                            .accounts = make_vault_metas(authority, vault),
                            .data = std::move(data)};
}

instruction_call_t make_credit_vault_instruction(const address_t& program_id,
                                                 const address_t& authority,
                                                 const address_t& vault,
                                                 const lamports_t amount) {
  auto data = bytes_t(coffer::program::kCreditVaultInstructionSize, 0);
  data[0] = static_cast<uint8_t>(instruction_tag_t::credit_vault);
  write_amount(data, amount);
  return instruction_call_t{.program_id = program_id,
                            .accounts = make_vault_metas(authority, vault),
                            .data = std::move(data)};
}

instruction_call_t make_debit_vault_instruction(const address_t& program_id,
                                                const address_t& authority,
                                                const address_t& vault,
                                                const lamports_t amount,
                                                const uint8_t bump) {
  auto data = bytes_t(coffer::program::kDebitVaultInstructionSize, 0);
  data[0] = static_cast<uint8_t>(instruction_tag_t::debit_vault);
  write_amount(data, amount);
  data[9] = bump;
  return instruction_call_t{.program_id = program_id,
                            .accounts = make_vault_metas(authority, vault),
                            .data = std::move(data)};
}

coffer::ledger::transaction_t make_transaction(
    std::vector<instruction_call_t> instructions,
    const hash32_t& recent_blockhash,
    const std::vector<coffer::crypto::keypair_t>& signers) {
  if (signers.empty()) {
    coffer::common::critical("a transaction needs at least one signer");
  }
  auto transaction = coffer::ledger::transaction_t{};
  transaction.message.fee_payer = signers.front().public_key;
  transaction.message.recent_blockhash = recent_blockhash;
  transaction.message.instructions = std::move(instructions);

  const auto message = coffer::ledger::serialize_message(transaction.message);
  for (const auto& signer : signers) {
    transaction.signatures.push_back(coffer::ledger::signature_entry_t{
        .signer = signer.public_key,
        .signature = coffer::crypto::sign(make_bytes_view(message), signer)});
  }
  return transaction;
}

}  // namespace coffer::client
