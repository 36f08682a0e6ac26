#pragma once

#include <coffer/ledger/options.hpp>
#include <coffer/program/system_interface.hpp>
#include <coffer/schema/primitives.hpp>

namespace coffer::ledger {

/// Lamports an account of `space` data bytes must hold to be rent exempt.
coffer::schema::lamports_t minimum_balance(uint64_t space,
                                           const ledger_options& options);

/// System services for one invocation of `caller_program_id`.
///
/// Seeds passed as signer seeds authorize the address they derive under
/// `caller_program_id`, the same as a signature on that address.
coffer::program::system_interface make_system_interface(
    const coffer::schema::address_t& caller_program_id,
    const ledger_options& options);

}  // namespace coffer::ledger
