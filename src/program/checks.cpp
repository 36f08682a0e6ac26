#include <coffer/program/checks.hpp>

#include <string>

using namespace coffer::schema;

namespace coffer::program {

program_result_t require_signer(const account_info& account) {
  if (!account.is_signer()) {
    return make_failure(program_error_code::missing_required_signature,
                        "account " + to_hex(account.key()) + " must sign",
                        kProgramCodespace);
  }
  return make_success();
}

program_result_t require_owned_by(const account_info& account,
                                  const address_t& owner) {
  if (!account.owned_by(owner)) {
    return make_failure(program_error_code::illegal_owner,
                        "account " + to_hex(account.key()) +
                            " is owned by " + to_hex(account.owner()),
                        kProgramCodespace);
  }
  return make_success();
}

program_result_t require_writable(const account_info& account) {
  if (!account.is_writable()) {
    return make_failure(program_error_code::immutable_account,
                        "account " + to_hex(account.key()) +
                            " must be writable",
                        kProgramCodespace);
  }
  return make_success();
}

program_result_t require_system_program(const account_info& account) {
  if (account.key() != kSystemProgramId) {
    return make_failure(program_error_code::incorrect_program_id,
                        "expected system program, got " + to_hex(account.key()),
                        kProgramCodespace);
  }
  return make_success();
}

program_result_t require_account_count(std::span<const account_info> accounts,
                                       const std::size_t count) {
  if (accounts.size() < count) {
    return make_failure(program_error_code::not_enough_account_keys,
                        "expected " + std::to_string(count) +
                            " accounts, got " +
                            std::to_string(accounts.size()),
                        kProgramCodespace);
  }
  return make_success();
}

}  // namespace coffer::program
