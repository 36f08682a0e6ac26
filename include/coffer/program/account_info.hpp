#pragma once

#include <coffer/schema/account.hpp>
#include <coffer/schema/primitives.hpp>

namespace coffer::ledger {
struct account_access;
}  // namespace coffer::ledger

namespace coffer::program {

/// Storage handle for one account referenced by a request.
///
/// The host fills in the key and the signer/writable flags from the
/// transaction; the handle refers to host storage and never copies it, so
/// writes through `data()` land in the account itself. Ownership and
/// allocation change only through the host's system services; the host
/// rejects an instruction that rewrites or drains an account the invoking
/// program does not own.
class account_info final {
 public:
  account_info(const coffer::schema::address_t& key,
               coffer::schema::account_t& account,
               bool is_signer,
               bool is_writable)
      : key_{key},
        account_{&account},
        is_signer_{is_signer},
        is_writable_{is_writable} {}

  const coffer::schema::address_t& key() const { return key_; }
  bool is_signer() const { return is_signer_; }
  bool is_writable() const { return is_writable_; }

  const coffer::schema::address_t& owner() const { return account_->owner; }
  bool owned_by(const coffer::schema::address_t& owner) const {
    return account_->owner == owner;
  }

  coffer::schema::lamports_t lamports() const { return account_->lamports; }
  void set_lamports(const coffer::schema::lamports_t lamports) {
    account_->lamports = lamports;
  }

  coffer::schema::mutable_bytes_view_t data() {
    return coffer::schema::mutable_bytes_view_t{account_->data};
  }
  coffer::schema::bytes_view_t data() const {
    return coffer::schema::bytes_view_t{account_->data};
  }

 private:
  friend struct coffer::ledger::account_access;

  coffer::schema::address_t key_;
  coffer::schema::account_t* account_;
  bool is_signer_{false};
  bool is_writable_{false};
};

}  // namespace coffer::program
