#include <coffer/program/checks.hpp>
#include <coffer/program/handlers.hpp>
#include <coffer/program/vault_seeds.hpp>
#include <coffer/schema/vault_state.hpp>
#include <spdlog/spdlog.h>

using namespace coffer::schema;

namespace coffer::program {

program_result_t debit_vault(const address_t& program_id,
                             std::span<account_info> accounts,
                             const debit_vault_t& instruction,
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

  const auto balance = state->balance();
  if (balance < instruction.amount) {
    return make_failure(program_error_code::insufficient_funds,
                        "debit of " + std::to_string(instruction.amount) +
                            " exceeds balance " + std::to_string(balance),
                        kProgramCodespace);
  }

  const auto bump = bump_seed_t{instruction.bump};
  const auto seeds = make_vault_seeds(authority.key(), bump);
  if (!system.verify_derivation(vault.key(), seeds, program_id)) {
    return make_failure(program_error_code::derivation_mismatch,
                        "bump " + std::to_string(instruction.bump) +
                            " does not derive vault " + to_hex(vault.key()),
                        kProgramCodespace);
  }
  if (auto result = require_system_program(system_program);
      !succeeded(result)) {
    return result;
  }

  // The vault has no key; the seeds stand in for its signature.
  auto transferred = system.transfer(vault, authority, instruction.amount,
                                     signer_seeds_t{seeds});
  if (!succeeded(transferred)) {
    return transferred;
  }
  state->set_balance(balance - instruction.amount);

  spdlog::debug("Debited vault {} by {} lamports, balance {}",
                to_hex(vault.key()), instruction.amount, state->balance());
  return make_success();
}

}  // namespace coffer::program
