#pragma once
#include <coffer/schema/primitives.hpp>
#include <cstdint>

// Schema type: debit vault.
// Custody workflow: Returns `amount` lamports from the vault to its authority.
// The vault has no key of its own, so the transfer is authorized by the
// derivation seeds completed with `bump`.
namespace coffer::schema {

template <uint16_t Version>
struct debit_vault;

template <>
struct debit_vault<1> final {
  uint16_t version{1};
  lamports_t amount{};
  uint8_t bump{};

  bool operator==(const debit_vault<1>&) const = default;
};

using debit_vault_t = debit_vault<1>;

}  // namespace coffer::schema
