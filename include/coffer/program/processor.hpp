#pragma once

#include <coffer/program/account_info.hpp>
#include <coffer/program/system_interface.hpp>
#include <coffer/schema/primitives.hpp>
#include <coffer/schema/program_result.hpp>

#include <span>

namespace coffer::program {

/// Entry point of the vault program.
///
/// Decodes `data` once and routes the operation to its handler together with
/// `accounts`. A payload that does not decode fails
/// `invalid_instruction_data` before any handler runs; otherwise the
/// handler's result is returned as is.
coffer::schema::program_result_t process(
    const coffer::schema::address_t& program_id,
    std::span<account_info> accounts,
    const coffer::schema::bytes_view_t& data,
    system_interface& system);

}  // namespace coffer::program
