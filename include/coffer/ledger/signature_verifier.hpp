#pragma once

#include <coffer/schema/primitives.hpp>
#include <functional>

namespace coffer::ledger {

using signature_verifier_t =
    std::function<bool(const coffer::schema::bytes_view_t& message,
                       const coffer::schema::address_t& signer,
                       const coffer::schema::ed25519_signature_t& signature)>;

}  // namespace coffer::ledger
