#pragma once
#include <coffer/schema/create_vault.hpp>
#include <coffer/schema/credit_vault.hpp>
#include <coffer/schema/debit_vault.hpp>
#include <cstdint>
#include <variant>

namespace coffer::schema {

/// Leading byte of every instruction payload.
enum class instruction_tag_t : uint8_t {
  create_vault = 0,
  credit_vault = 1,
  debit_vault = 2
};

using vault_instruction_t =
    std::variant<create_vault_t, credit_vault_t, debit_vault_t>;

}  // namespace coffer::schema
