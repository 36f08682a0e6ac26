#pragma once

#include <coffer/schema/primitives.hpp>

namespace coffer::crypto {

bool available();

/// Verify an ed25519 `signature` of `message` by the key at `signer`.
bool verify_signature(const coffer::schema::bytes_view_t& message,
                      const coffer::schema::address_t& signer,
                      const coffer::schema::ed25519_signature_t& signature);

}  // namespace coffer::crypto
