#pragma once

#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

namespace coffer::schema {

enum class program_error_code : uint32_t {
  invalid_instruction_data = 1,
  missing_required_signature = 2,
  illegal_owner = 3,
  invalid_account_data = 4,
  authority_mismatch = 5,
  derivation_mismatch = 6,
  arithmetic_overflow = 7,
  insufficient_funds = 8,
  not_enough_account_keys = 9,
  incorrect_program_id = 10,
  immutable_account = 11,
  // Raised by the value transfer collaborator.
  account_already_in_use = 20,
  insufficient_lamports = 21,
  max_seed_length_exceeded = 22,
  // Raised by the host ledger during admission and commit.
  program_not_found = 30,
  signature_verification_failed = 31,
  blockhash_not_found = 32,
  already_processed = 33,
  unbalanced_transaction = 34,
  readonly_data_modified = 35,
  external_account_data_modified = 36,
  external_account_lamport_spend = 37,
};

inline constexpr auto kProgramErrorCodeMappings = std::array{
    std::pair<std::string_view, program_error_code>{
        "invalid_instruction_data",
        program_error_code::invalid_instruction_data},
    std::pair<std::string_view, program_error_code>{
        "missing_required_signature",
        program_error_code::missing_required_signature},
    std::pair<std::string_view, program_error_code>{
        "illegal_owner", program_error_code::illegal_owner},
    std::pair<std::string_view, program_error_code>{
        "invalid_account_data", program_error_code::invalid_account_data},
    std::pair<std::string_view, program_error_code>{
        "authority_mismatch", program_error_code::authority_mismatch},
    std::pair<std::string_view, program_error_code>{
        "derivation_mismatch", program_error_code::derivation_mismatch},
    std::pair<std::string_view, program_error_code>{
        "arithmetic_overflow", program_error_code::arithmetic_overflow},
    std::pair<std::string_view, program_error_code>{
        "insufficient_funds", program_error_code::insufficient_funds},
    std::pair<std::string_view, program_error_code>{
        "not_enough_account_keys", program_error_code::not_enough_account_keys},
    std::pair<std::string_view, program_error_code>{
        "incorrect_program_id", program_error_code::incorrect_program_id},
    std::pair<std::string_view, program_error_code>{
        "immutable_account", program_error_code::immutable_account},
    std::pair<std::string_view, program_error_code>{
        "account_already_in_use", program_error_code::account_already_in_use},
    std::pair<std::string_view, program_error_code>{
        "insufficient_lamports", program_error_code::insufficient_lamports},
    std::pair<std::string_view, program_error_code>{
        "max_seed_length_exceeded",
        program_error_code::max_seed_length_exceeded},
    std::pair<std::string_view, program_error_code>{
        "program_not_found", program_error_code::program_not_found},
    std::pair<std::string_view, program_error_code>{
        "signature_verification_failed",
        program_error_code::signature_verification_failed},
    std::pair<std::string_view, program_error_code>{
        "blockhash_not_found", program_error_code::blockhash_not_found},
    std::pair<std::string_view, program_error_code>{
        "already_processed", program_error_code::already_processed},
    std::pair<std::string_view, program_error_code>{
        "unbalanced_transaction", program_error_code::unbalanced_transaction},
    std::pair<std::string_view, program_error_code>{
        "readonly_data_modified", program_error_code::readonly_data_modified},
    std::pair<std::string_view, program_error_code>{
        "external_account_data_modified",
        program_error_code::external_account_data_modified},
    std::pair<std::string_view, program_error_code>{
        "external_account_lamport_spend",
        program_error_code::external_account_lamport_spend},
};

inline constexpr std::string_view to_string(const program_error_code value) {
  for (const auto& [name, code] : kProgramErrorCodeMappings) {
    if (code == value) {
      return name;
    }
  }
  return "unknown";
}

}  // namespace coffer::schema
