#pragma once
#include <coffer/schema/primitives.hpp>
#include <vector>

namespace coffer::ledger {

struct account_meta_t final {
  coffer::schema::address_t key{};
  bool is_signer{false};
  bool is_writable{false};
};

/// One program invocation inside a transaction.
struct instruction_call_t final {
  coffer::schema::address_t program_id{};
  std::vector<account_meta_t> accounts;
  coffer::schema::bytes_t data;
};

struct message_t final {
  coffer::schema::address_t fee_payer{};
  coffer::schema::hash32_t recent_blockhash{};
  std::vector<instruction_call_t> instructions;
};

struct signature_entry_t final {
  coffer::schema::address_t signer{};
  coffer::schema::ed25519_signature_t signature{};
};

struct transaction_t final {
  message_t message;
  std::vector<signature_entry_t> signatures;
};

/// Bytes every signer of `message` signs.
coffer::schema::bytes_t serialize_message(const message_t& message);

}  // namespace coffer::ledger
