#include <coffer/program/checks.hpp>
#include <coffer/program/handlers.hpp>
#include <coffer/schema/vault_state.hpp>
#include <spdlog/spdlog.h>

#include <limits>

using namespace coffer::schema;

namespace coffer::program {

program_result_t credit_vault(const address_t& program_id,
                              std::span<account_info> accounts,
                              const credit_vault_t& instruction,
                              system_interface& system) {
  if (auto result = require_account_count(accounts, kVaultAccountCount);
      !succeeded(result)) {
    return result;
  }
  auto& authority = accounts[kAuthorityAccountIndex];
  auto& vault = accounts[kVaultAccountIndex];
  auto& system_program = accounts[kSystemProgramAccountIndex];

  if (auto result = require_signer(authority); !succeeded(result)) {
    return result;
  }
  if (auto result = require_owned_by(vault, program_id); !succeeded(result)) {
    return result;
  }
  auto state = vault_state::load(vault.data());
  if (!state.has_value()) {
    return make_failure(program_error_code::invalid_account_data,
                        "account " + to_hex(vault.key()) + " is not a vault",
                        kProgramCodespace);
  }
  if (state->authority() != authority.key()) {
    return make_failure(program_error_code::authority_mismatch,
                        "vault " + to_hex(vault.key()) +
                            " belongs to another authority",
                        kProgramCodespace);
  }
  if (auto result = require_writable(vault); !succeeded(result)) {
    return result;
  }
  if (auto result = require_system_program(system_program);
      !succeeded(result)) {
    return result;
  }

  // The authority signed the request, so the transfer needs no seeds.
  auto transferred =
      system.transfer(authority, vault, instruction.amount, signer_seeds_t{});
  if (!succeeded(transferred)) {
    return transferred;
  }

  const auto balance = state->balance();
  if (instruction.amount > std::numeric_limits<lamports_t>::max() - balance) {
    return make_failure(program_error_code::arithmetic_overflow,
                        "credit of " + std::to_string(instruction.amount) +
                            " overflows balance " + std::to_string(balance),
                        kProgramCodespace);
  }
  state->set_balance(balance + instruction.amount);

  spdlog::debug("Credited vault {} with {} lamports, balance {}",
                to_hex(vault.key()), instruction.amount, state->balance());
  return make_success();
}

}  // namespace coffer::program
