#pragma once
#include <cstdint>

// Schema type: create vault.
// Custody workflow: Allocates the authority's vault record at its derived
// address. `bump` is the seed byte that completes the derivation.
namespace coffer::schema {

template <uint16_t Version>
struct create_vault;

template <>
struct create_vault<1> final {
  uint16_t version{1};
  uint8_t bump{};

  bool operator==(const create_vault<1>&) const = default;
};

using create_vault_t = create_vault<1>;

}  // namespace coffer::schema
