#pragma once

#include <coffer/program/system_interface.hpp>
#include <coffer/schema/primitives.hpp>
#include <coffer/schema/vault_state.hpp>

#include <array>
#include <cstdint>

namespace coffer::program {

using bump_seed_t = std::array<uint8_t, 1>;

/// Seeds `("vault", authority)` shared by every vault address. The returned
/// views point into `authority`.
inline seeds_t make_vault_seeds(const coffer::schema::address_t& authority) {
  return seeds_t{coffer::schema::make_bytes_view(coffer::schema::kVaultSeed),
                 coffer::schema::bytes_view_t{authority}};
}

/// Seeds `("vault", authority, bump)` of one vault address. The returned
/// views point into `authority` and `bump`.
inline seeds_t make_vault_seeds(const coffer::schema::address_t& authority,
                                const bump_seed_t& bump) {
  auto seeds = make_vault_seeds(authority);
  seeds.push_back(coffer::schema::bytes_view_t{bump});
  return seeds;
}

}  // namespace coffer::program
