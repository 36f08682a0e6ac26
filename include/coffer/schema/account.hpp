#pragma once
#include <coffer/schema/primitives.hpp>

// Schema type: account.
// Custody workflow: Host-resident state of one address. Programs never hold
// an account directly; they receive `program::account_info` handles to it.
namespace coffer::schema {

struct account_t final {
  lamports_t lamports{};
  address_t owner{kSystemProgramId};
  bytes_t data;
  bool executable{false};

  bool operator==(const account_t&) const = default;
};

}  // namespace coffer::schema
