#include <coffer/ledger/derivation.hpp>
#include <coffer/ledger/system_program.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>
#include <string>

using namespace coffer::schema;
using coffer::program::account_info;
using coffer::program::signer_seeds_t;

namespace coffer::ledger {

/// Host-side view of the account behind a handle.
struct account_access final {
  static account_t& of(account_info& info) { return *info.account_; }
};

namespace {

bool is_authorized(const account_info& account,
                   const signer_seeds_t& signer_seeds,
                   const address_t& caller_program_id) {
  if (account.is_signer()) {
    return true;
  }
  return std::any_of(std::begin(signer_seeds), std::end(signer_seeds),
                     [&](const auto& seeds) {
                       return verify_derivation(account.key(), seeds,
                                                caller_program_id);
                     });
}

program_result_t fail(const program_error_code code, std::string log) {
  return make_failure(code, std::move(log), kSystemCodespace);
}

bool in_use(const account_t& account) {
  return account.lamports > 0 || !account.data.empty() ||
         account.owner != kSystemProgramId;
}

}  // namespace

lamports_t minimum_balance(const uint64_t space,
                           const ledger_options& options) {
  return (options.account_storage_overhead + space) *
         options.lamports_per_byte_year * options.exemption_threshold_years;
}

coffer::program::system_interface make_system_interface(
    const address_t& caller_program_id,
    const ledger_options& options) {
  auto system = coffer::program::system_interface{};

  system.minimum_balance = [options](const uint64_t space) {
    return minimum_balance(space, options);
  };

  system.create_account = [caller_program_id](
                              account_info& funder, account_info& target,
                              const lamports_t lamports, const uint64_t space,
                              const address_t& owner,
                              const signer_seeds_t& signer_seeds) {
    if (!funder.is_signer()) {
      return fail(program_error_code::missing_required_signature,
                  "funder " + to_hex(funder.key()) + " did not sign");
    }
    if (!is_authorized(target, signer_seeds, caller_program_id)) {
      return fail(program_error_code::missing_required_signature,
                  "new account " + to_hex(target.key()) + " is not authorized");
    }
    if (!funder.is_writable() || !target.is_writable()) {
      return fail(program_error_code::immutable_account,
                  "create_account needs writable funder and target");
    }
    if (in_use(account_access::of(target))) {
      return fail(program_error_code::account_already_in_use,
                  "account " + to_hex(target.key()) + " already in use");
    }
    if (funder.lamports() < lamports) {
      return fail(program_error_code::insufficient_lamports,
                  "funder holds " + std::to_string(funder.lamports()) +
                      ", needs " + std::to_string(lamports));
    }

    account_access::of(funder).lamports -= lamports;
    auto& created = account_access::of(target);
    created.lamports = lamports;
    created.data.assign(space, 0);
    created.owner = owner;
    spdlog::debug("Created account {} with {} bytes owned by {}",
                  to_hex(target.key()), space, to_hex(owner));
    return make_success();
  };

  system.transfer = [caller_program_id](account_info& from, account_info& to,
                                        const lamports_t lamports,
                                        const signer_seeds_t& signer_seeds) {
    if (!is_authorized(from, signer_seeds, caller_program_id)) {
      return fail(program_error_code::missing_required_signature,
                  "transfer source " + to_hex(from.key()) +
                      " is not authorized");
    }
    if (!from.is_writable() || !to.is_writable()) {
      return fail(program_error_code::immutable_account,
                  "transfer needs writable source and destination");
    }
    if (from.lamports() < lamports) {
      return fail(program_error_code::insufficient_lamports,
                  "source holds " + std::to_string(from.lamports()) +
                      ", needs " + std::to_string(lamports));
    }
    if (to.lamports() > std::numeric_limits<lamports_t>::max() - lamports) {
      return fail(program_error_code::arithmetic_overflow,
                  "destination balance would overflow");
    }

    account_access::of(from).lamports -= lamports;
    account_access::of(to).lamports += lamports;
    return make_success();
  };

  system.derive_address = [](const coffer::program::seeds_t& seeds,
                             const address_t& program_id) {
    return derive_address(seeds, program_id);
  };

  system.verify_derivation = [](const address_t& address,
                                const coffer::program::seeds_t& seeds,
                                const address_t& program_id) {
    return verify_derivation(address, seeds, program_id);
  };

  return system;
}

}  // namespace coffer::ledger
