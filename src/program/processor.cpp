#include <coffer/program/handlers.hpp>
#include <coffer/program/instruction_decoder.hpp>
#include <coffer/program/processor.hpp>
#include <spdlog/spdlog.h>

#include <string>
#include <string_view>
#include <variant>

using namespace coffer::schema;

namespace coffer::program {

program_result_t process(const address_t& program_id,
                         std::span<account_info> accounts,
                         const bytes_view_t& data,
                         system_interface& system) {
  auto decode_error = std::string{};
  auto instruction = decode_instruction(data, decode_error);
  if (!instruction.has_value()) {
    spdlog::warn("Rejected vault instruction: {}", decode_error);
    return make_failure(program_error_code::invalid_instruction_data,
                        decode_error, kProgramCodespace);
  }

  auto operation = std::string_view{};
  auto result = std::visit(
      overloaded{[&](const create_vault_t& value) {
                   operation = "create_vault";
                   return create_vault(program_id, accounts, value, system);
                 },
                 [&](const credit_vault_t& value) {
                   operation = "credit_vault";
                   return credit_vault(program_id, accounts, value, system);
                 },
                 [&](const debit_vault_t& value) {
                   operation = "debit_vault";
                   return debit_vault(program_id, accounts, value, system);
                 }},
      *instruction);

  if (!succeeded(result)) {
    spdlog::warn("{} failed with {}: {}", operation,
                 to_string(static_cast<program_error_code>(result.code)),
                 result.log);
  }
  return result;
}

}  // namespace coffer::program
