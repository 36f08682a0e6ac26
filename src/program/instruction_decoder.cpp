#include <boost/endian/conversion.hpp>
#include <coffer/program/instruction_decoder.hpp>

#include <string_view>

using namespace coffer::schema;

namespace coffer::program {

namespace {

lamports_t read_amount(const bytes_view_t& data) {
  return boost::endian::endian_load<lamports_t, sizeof(lamports_t),
                                    boost::endian::order::little>(
      data.data() + 1);
}

bool has_length(const bytes_view_t& data,
                const std::size_t required,
                const std::string_view name,
                std::string& error) {
  if (data.size() < required) {
    error = std::string{name} + " expects " + std::to_string(required) +
            " bytes, got " + std::to_string(data.size());
    return false;
  }
  return true;
}

}  // namespace

std::optional<vault_instruction_t> decode_instruction(const bytes_view_t& data,
                                                      std::string& error) {
  if (data.empty()) {
    error = "empty instruction data";
    return std::nullopt;
  }

  switch (static_cast<instruction_tag_t>(data[0])) {
    case instruction_tag_t::create_vault:
      if (!has_length(data, kCreateVaultInstructionSize, "create_vault",
                      error)) {
        return std::nullopt;
      }
      return create_vault_t{.bump = data[1]};
    case instruction_tag_t::credit_vault:
      if (!has_length(data, kCreditVaultInstructionSize, "credit_vault",
                      error)) {
        return std::nullopt;
      }
      return credit_vault_t{.amount = read_amount(data)};
    case instruction_tag_t::debit_vault:
      if (!has_length(data, kDebitVaultInstructionSize, "debit_vault", error)) {
        return std::nullopt;
      }
      return debit_vault_t{.amount = read_amount(data), .bump = data[9]};
  }

  error = "unknown operation tag " + std::to_string(data[0]);
  return std::nullopt;
}

}  // namespace coffer::program
