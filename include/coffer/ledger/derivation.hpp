#pragma once
#include <coffer/program/system_interface.hpp>
#include <coffer/schema/primitives.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

namespace coffer::ledger {

inline constexpr auto kMaxSeeds = std::size_t{16};
inline constexpr auto kMaxSeedLength = std::size_t{32};
inline constexpr auto kDerivedAddressMarker =
    std::string_view{"ProgramDerivedAddress"};

/// Address of `seeds` under `program_id`:
/// `blake3(seed_0 || ... || seed_n || program_id || "ProgramDerivedAddress")`.
///
/// Returns std::nullopt for more than `kMaxSeeds` seeds or a seed longer than
/// `kMaxSeedLength` bytes. No key exists for a derived address; only the
/// program can authorize for it by presenting the seeds again.
std::optional<coffer::schema::address_t> derive_address(
    const coffer::program::seeds_t& seeds,
    const coffer::schema::address_t& program_id);

bool verify_derivation(const coffer::schema::address_t& address,
                       const coffer::program::seeds_t& seeds,
                       const coffer::schema::address_t& program_id);

/// First address derivable from `seeds` plus one bump byte, trying bumps
/// from 255 down.
std::optional<std::pair<coffer::schema::address_t, uint8_t>>
find_program_address(const coffer::program::seeds_t& seeds,
                     const coffer::schema::address_t& program_id);

}  // namespace coffer::ledger
