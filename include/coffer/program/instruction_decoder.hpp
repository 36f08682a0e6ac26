#pragma once

#include <coffer/schema/instruction.hpp>
#include <coffer/schema/primitives.hpp>

#include <cstddef>
#include <optional>
#include <string>

namespace coffer::program {

inline constexpr auto kCreateVaultInstructionSize = std::size_t{2};
inline constexpr auto kCreditVaultInstructionSize = std::size_t{9};
inline constexpr auto kDebitVaultInstructionSize = std::size_t{10};

/// Parse an instruction payload.
///
/// Byte 0 selects the operation, the remaining bytes carry its fields with
/// integers in little-endian order. Bytes past an operation's fields are
/// ignored. On failure returns std::nullopt and describes the problem in
/// `error`; the payload is never modified and nothing else is touched.
std::optional<coffer::schema::vault_instruction_t> decode_instruction(
    const coffer::schema::bytes_view_t& data,
    std::string& error);

}  // namespace coffer::program
