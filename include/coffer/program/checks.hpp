#pragma once

#include <coffer/program/account_info.hpp>
#include <coffer/schema/primitives.hpp>
#include <coffer/schema/program_result.hpp>

#include <cstddef>
#include <span>

namespace coffer::program {

/// Fails `missing_required_signature` unless `account` signed the request.
coffer::schema::program_result_t require_signer(const account_info& account);

/// Fails `illegal_owner` unless `account` is owned by `owner`.
///
/// Ownership by the program proves the account data was written by the
/// program and not supplied by the caller.
coffer::schema::program_result_t require_owned_by(
    const account_info& account,
    const coffer::schema::address_t& owner);

/// Fails `immutable_account` unless `account` is writable.
coffer::schema::program_result_t require_writable(const account_info& account);

/// Fails `incorrect_program_id` unless `account` is the system program.
coffer::schema::program_result_t require_system_program(
    const account_info& account);

/// Fails `not_enough_account_keys` when fewer than `count` accounts are
/// given.
coffer::schema::program_result_t require_account_count(
    std::span<const account_info> accounts,
    std::size_t count);

}  // namespace coffer::program
