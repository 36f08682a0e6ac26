#pragma once

#include <coffer/ledger/options.hpp>
#include <coffer/ledger/signature_verifier.hpp>
#include <coffer/ledger/transaction.hpp>
#include <coffer/program/account_info.hpp>
#include <coffer/program/system_interface.hpp>
#include <coffer/schema/account.hpp>
#include <coffer/schema/encoding/scale/encoder.hpp>
#include <coffer/schema/primitives.hpp>
#include <coffer/schema/program_result.hpp>
#include <coffer/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <span>

namespace coffer::ledger {

/// Entry point the ledger calls for every instruction addressed to a
/// registered program.
using entrypoint_t = std::function<coffer::schema::program_result_t(
    const coffer::schema::address_t& program_id,
    std::span<coffer::program::account_info> accounts,
    const coffer::schema::bytes_view_t& data,
    coffer::program::system_interface& system)>;

/// Single-node ledger hosting programs over a persisted account set.
///
/// A transaction runs its instructions in order against a working copy of
/// every account it names; the copy replaces the committed accounts only when
/// all instructions succeed and the lamport total of the touched accounts is
/// unchanged. Any failure leaves the ledger exactly as it was.
class ledger final {
 public:
  explicit ledger(
      coffer::schema::encoding::encoder<
          coffer::schema::encoding::scale_encoder_tag>& encoder,
      coffer::storage::storage<coffer::storage::rocksdb_storage_tag>& storage,
      ledger_options options = {});

  /// Register `entrypoint` under `program_id` and mark the account
  /// executable.
  void add_program(const coffer::schema::address_t& program_id,
                   entrypoint_t entrypoint);

  /// Replace the signature check applied to every transaction signer.
  void set_signature_verifier(signature_verifier_t verifier);

  /// Committed account at `address`, or std::nullopt when none exists.
  std::optional<coffer::schema::account_t> get_account(
      const coffer::schema::address_t& address) const;

  /// Overwrite the account at `address` outside any transaction.
  void set_account(const coffer::schema::address_t& address,
                   coffer::schema::account_t account);

  /// Mint `lamports` into `address`.
  coffer::schema::program_result_t airdrop(
      const coffer::schema::address_t& address,
      coffer::schema::lamports_t lamports);

  coffer::schema::lamports_t minimum_balance(uint64_t space) const;

  /// Blockhash a new transaction must reference.
  coffer::schema::hash32_t latest_blockhash() const;
  uint64_t slot() const;

  /// Advance to a new blockhash; transactions referencing the old one are
  /// rejected from then on.
  void expire_blockhash();

  /// Verify, execute and commit `transaction` atomically.
  coffer::schema::program_result_t send_transaction(
      const transaction_t& transaction);

 private:
  coffer::schema::program_result_t verify_transaction(
      const transaction_t& transaction,
      const coffer::schema::bytes_t& message) const;

  coffer::schema::program_result_t execute_instruction(
      const instruction_call_t& instruction,
      std::map<coffer::schema::address_t, coffer::schema::account_t>& working)
      const;

  coffer::schema::account_t load_account(
      const coffer::schema::address_t& address) const;
  void advance_blockhash();
  void persist(const std::map<coffer::schema::address_t,
                              coffer::schema::account_t>& accounts);
  void load_persisted_state();

  mutable std::mutex mutex_;
  coffer::schema::encoding::encoder<
      coffer::schema::encoding::scale_encoder_tag>& encoder_;
  coffer::storage::storage<coffer::storage::rocksdb_storage_tag>& storage_;
  ledger_options options_;
  signature_verifier_t signature_verifier_;
  std::map<coffer::schema::address_t, coffer::schema::account_t> accounts_;
  std::map<coffer::schema::address_t, entrypoint_t> programs_;
  std::set<coffer::schema::ed25519_signature_t> processed_signatures_;
  uint64_t slot_{};
  coffer::schema::hash32_t blockhash_{};
};

}  // namespace coffer::ledger
