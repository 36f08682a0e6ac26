#include <coffer/blake3/hash.hpp>
#include <coffer/ledger/derivation.hpp>

#include <array>

namespace coffer::ledger {

std::optional<coffer::schema::address_t> derive_address(
    const coffer::program::seeds_t& seeds,
    const coffer::schema::address_t& program_id) {
  if (seeds.size() > kMaxSeeds) {
    return std::nullopt;
  }
  auto hasher = coffer::blake3::hasher{};
  for (const auto& seed : seeds) {
    if (seed.size() > kMaxSeedLength) {
      return std::nullopt;
    }
    hasher.update(seed);
  }
  hasher.update(coffer::schema::bytes_view_t{program_id})
      .update(kDerivedAddressMarker);
  return hasher.finalize();
}

bool verify_derivation(const coffer::schema::address_t& address,
                       const coffer::program::seeds_t& seeds,
                       const coffer::schema::address_t& program_id) {
  auto derived = derive_address(seeds, program_id);
  return derived.has_value() && *derived == address;
}

std::optional<std::pair<coffer::schema::address_t, uint8_t>>
find_program_address(const coffer::program::seeds_t& seeds,
                     const coffer::schema::address_t& program_id) {
  for (auto bump = 255; bump >= 0; --bump) {
    const auto bump_seed = std::array<uint8_t, 1>{static_cast<uint8_t>(bump)};
    auto candidate = seeds;
    candidate.push_back(coffer::schema::bytes_view_t{bump_seed});
    if (auto address = derive_address(candidate, program_id)) {
      return std::pair{*address, static_cast<uint8_t>(bump)};
    }
  }
  return std::nullopt;
}

}  // namespace coffer::ledger
