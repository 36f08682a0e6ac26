#include <coffer/program/checks.hpp>
#include <coffer/program/handlers.hpp>
#include <coffer/program/vault_seeds.hpp>
#include <coffer/schema/vault_state.hpp>
#include <spdlog/spdlog.h>

using namespace coffer::schema;

namespace coffer::program {

program_result_t create_vault(const address_t& program_id,
                              std::span<account_info> accounts,
                              const create_vault_t& instruction,
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

  // The client finds the bump off-chain; only the address it yields is
  // accepted.
  const auto bump = bump_seed_t{instruction.bump};
  const auto seeds = make_vault_seeds(authority.key(), bump);
  const auto derived = system.derive_address(seeds, program_id);
  if (!derived.has_value() || *derived != vault.key()) {
    return make_failure(program_error_code::derivation_mismatch,
                        "bump " + std::to_string(instruction.bump) +
                            " does not derive vault " + to_hex(vault.key()),
                        kProgramCodespace);
  }

  if (auto result = require_system_program(system_program);
      !succeeded(result)) {
    return result;
  }

  auto allocated = system.create_account(
      authority, vault, system.minimum_balance(kVaultStateSize),
      kVaultStateSize, program_id, signer_seeds_t{seeds});
  if (!succeeded(allocated)) {
    return allocated;
  }

  if (!vault_state::initialize(vault.data(), authority.key()).has_value()) {
    return make_failure(program_error_code::invalid_account_data,
                        "allocated vault has " +
                            std::to_string(vault.data().size()) + " bytes",
                        kProgramCodespace);
  }

  spdlog::debug("Created vault {} for authority {}", to_hex(vault.key()),
                to_hex(authority.key()));
  return make_success();
}

}  // namespace coffer::program
