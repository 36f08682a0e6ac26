#pragma once

#include <coffer/schema/primitives.hpp>

namespace coffer::crypto {

/// ed25519 key pair. The public key doubles as the account address.
struct keypair_t final {
  coffer::schema::ed25519_seed_t seed{};
  coffer::schema::address_t public_key{};
};

/// Generate a key pair from fresh randomness.
keypair_t generate_keypair();

/// Rebuild the key pair of a 32-byte private seed.
keypair_t keypair_from_seed(const coffer::schema::ed25519_seed_t& seed);

coffer::schema::ed25519_signature_t sign(
    const coffer::schema::bytes_view_t& message,
    const keypair_t& keypair);

}  // namespace coffer::crypto
