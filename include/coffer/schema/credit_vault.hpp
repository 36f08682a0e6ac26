#pragma once
#include <coffer/schema/primitives.hpp>
#include <cstdint>

// Schema type: credit vault.
// Custody workflow: Moves `amount` lamports from the authority into its vault
// and raises the recorded balance by the same amount.
namespace coffer::schema {

template <uint16_t Version>
struct credit_vault;

template <>
struct credit_vault<1> final {
  uint16_t version{1};
  lamports_t amount{};

  bool operator==(const credit_vault<1>&) const = default;
};

using credit_vault_t = credit_vault<1>;

}  // namespace coffer::schema
