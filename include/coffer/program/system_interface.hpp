#pragma once

#include <coffer/program/account_info.hpp>
#include <coffer/schema/primitives.hpp>
#include <coffer/schema/program_result.hpp>

#include <functional>
#include <optional>
#include <vector>

namespace coffer::program {

/// Ordered seed slices of one derived address.
using seeds_t = std::vector<coffer::schema::bytes_view_t>;

/// Seed sets a program presents in place of signatures for derived
/// addresses it controls.
using signer_seeds_t = std::vector<seeds_t>;

/// Services the host runtime provides to a program for one invocation.
///
/// Storage allocation and value transfer are applied by the host to the
/// accounts behind the handles. Signer checks and ownership are carried on
/// `account_info` itself.
struct system_interface final {
  /// Lamports an account of `space` data bytes must hold to persist.
  std::function<coffer::schema::lamports_t(uint64_t space)> minimum_balance;

  /// Allocate `space` zero bytes at `target`, funded with `lamports` from
  /// `funder`, owned by `owner`.
  std::function<coffer::schema::program_result_t(
      account_info& funder,
      account_info& target,
      coffer::schema::lamports_t lamports,
      uint64_t space,
      const coffer::schema::address_t& owner,
      const signer_seeds_t& signer_seeds)>
      create_account;

  /// Move `lamports` from `from` to `to`.
  std::function<coffer::schema::program_result_t(
      account_info& from,
      account_info& to,
      coffer::schema::lamports_t lamports,
      const signer_seeds_t& signer_seeds)>
      transfer;

  /// Address derived from `seeds` under `program_id`, or std::nullopt when
  /// the seeds are not a valid seed set.
  std::function<std::optional<coffer::schema::address_t>(
      const seeds_t& seeds,
      const coffer::schema::address_t& program_id)>
      derive_address;

  /// True when `seeds` under `program_id` derive `address`.
  std::function<bool(const coffer::schema::address_t& address,
                     const seeds_t& seeds,
                     const coffer::schema::address_t& program_id)>
      verify_derivation;
};

}  // namespace coffer::program
