#include <boost/endian/conversion.hpp>
#include <boost/multiprecision/cpp_int.hpp>
#include <coffer/blake3/hash.hpp>
#include <coffer/crypto/verify.hpp>
#include <coffer/ledger/ledger.hpp>
#include <coffer/ledger/system_program.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <iterator>
#include <limits>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

using namespace coffer::schema;

namespace {

inline constexpr auto kAccountPrefix = std::string_view{"ACCT|"};
inline constexpr auto kLedgerStateKey = std::string_view{"SYS|LEDGER|STATE"};
inline constexpr auto kGenesisSeed = std::string_view{"coffer.genesis"};

// Persisted row layouts.
using account_row_t = std::tuple<lamports_t, address_t, bytes_t, bool>;
using ledger_state_row_t = std::tuple<uint64_t, hash32_t>;

bytes_t make_account_key(const address_t& address) {
  auto key = make_bytes(kAccountPrefix);
  key.insert(std::end(key), std::begin(address), std::end(address));
  return key;
}

account_t make_executable_account() {
  return account_t{.lamports = 1,
                   .owner = kSystemProgramId,
                   .data = {},
                   .executable = true};
}

boost::multiprecision::uint128_t total_lamports(
    const std::map<address_t, account_t>& accounts) {
  auto total = boost::multiprecision::uint128_t{0};
  for (const auto& [address, account] : accounts) {
    total += account.lamports;
  }
  return total;
}

// Lamports moved and accounts allocated through system services during one
// instruction.
struct host_effects final {
  std::map<address_t, boost::multiprecision::int128_t> lamport_flow;
  std::set<address_t> allocated;
};

void record_host_effects(coffer::program::system_interface& system,
                         host_effects& effects) {
  system.create_account =
      [&effects, create = system.create_account](
          coffer::program::account_info& funder,
          coffer::program::account_info& target, const lamports_t lamports,
          const uint64_t space, const address_t& owner,
          const coffer::program::signer_seeds_t& signer_seeds) {
        auto result =
            create(funder, target, lamports, space, owner, signer_seeds);
        if (succeeded(result)) {
          effects.lamport_flow[funder.key()] -= lamports;
          effects.lamport_flow[target.key()] += lamports;
          effects.allocated.insert(target.key());
        }
        return result;
      };
  system.transfer = [&effects, transfer = system.transfer](
                        coffer::program::account_info& from,
                        coffer::program::account_info& to,
                        const lamports_t lamports,
                        const coffer::program::signer_seeds_t& signer_seeds) {
    auto result = transfer(from, to, lamports, signer_seeds);
    if (succeeded(result)) {
      effects.lamport_flow[from.key()] -= lamports;
      effects.lamport_flow[to.key()] += lamports;
    }
    return result;
  };
}

program_result_t ledger_failure(const program_error_code code,
                                std::string log) {
  return make_failure(code, std::move(log), kLedgerCodespace);
}

}  // namespace

namespace coffer::ledger {

ledger::ledger(
    coffer::schema::encoding::encoder<
        coffer::schema::encoding::scale_encoder_tag>& encoder,
    coffer::storage::storage<coffer::storage::rocksdb_storage_tag>& storage,
    ledger_options options)
    : encoder_{encoder},
      storage_{storage},
      options_{options},
      signature_verifier_{coffer::crypto::verify_signature} {
  auto lock = std::scoped_lock{mutex_};
  blockhash_ = coffer::blake3::hash(kGenesisSeed);
  load_persisted_state();
  accounts_.try_emplace(kSystemProgramId, make_executable_account());
  if (!coffer::crypto::available()) {
    spdlog::warn("ed25519 verification is unavailable; every signed "
                 "transaction will be rejected");
  }
  spdlog::info("Ledger ready at slot {} with {} account(s)", slot_,
               accounts_.size());
}

void ledger::add_program(const address_t& program_id,
                         entrypoint_t entrypoint) {
  auto lock = std::scoped_lock{mutex_};
  programs_[program_id] = std::move(entrypoint);
  auto& account = accounts_[program_id];
  if (!account.executable) {
    account = make_executable_account();
  }
  spdlog::info("Registered program {}", to_hex(program_id));
}

void ledger::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  signature_verifier_ = std::move(verifier);
}

std::optional<account_t> ledger::get_account(const address_t& address) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = accounts_.find(address);
  if (it == std::end(accounts_)) {
    return std::nullopt;
  }
  return it->second;
}

void ledger::set_account(const address_t& address, account_t account) {
  auto lock = std::scoped_lock{mutex_};
  auto changed = std::map<address_t, account_t>{{address, account}};
  accounts_[address] = std::move(account);
  persist(changed);
}

program_result_t ledger::airdrop(const address_t& address,
                                 const lamports_t lamports) {
  auto lock = std::scoped_lock{mutex_};
  auto account = load_account(address);
  if (account.lamports > std::numeric_limits<lamports_t>::max() - lamports) {
    return ledger_failure(program_error_code::arithmetic_overflow,
                          "airdrop would overflow balance of " +
                              to_hex(address));
  }
  account.lamports += lamports;
  accounts_[address] = account;
  persist(std::map<address_t, account_t>{{address, account}});
  spdlog::info("Airdropped {} lamports to {}", lamports, to_hex(address));
  return make_success();
}

lamports_t ledger::minimum_balance(const uint64_t space) const {
  return coffer::ledger::minimum_balance(space, options_);
}

hash32_t ledger::latest_blockhash() const {
  auto lock = std::scoped_lock{mutex_};
  return blockhash_;
}

uint64_t ledger::slot() const {
  auto lock = std::scoped_lock{mutex_};
  return slot_;
}

void ledger::expire_blockhash() {
  auto lock = std::scoped_lock{mutex_};
  advance_blockhash();
  persist({});
}

program_result_t ledger::send_transaction(const transaction_t& transaction) {
  auto lock = std::scoped_lock{mutex_};
  const auto message = serialize_message(transaction.message);
  if (auto result = verify_transaction(transaction, message);
      !succeeded(result)) {
    spdlog::warn("Rejected transaction: {}", result.log);
    return result;
  }

  auto working = std::map<address_t, account_t>{};
  for (const auto& instruction : transaction.message.instructions) {
    for (const auto& meta : instruction.accounts) {
      if (!working.contains(meta.key)) {
        working.emplace(meta.key, load_account(meta.key));
      }
    }
  }

  const auto& instructions = transaction.message.instructions;
  for (auto index = std::size_t{0}; index < instructions.size(); ++index) {
    auto result = execute_instruction(instructions[index], working);
    if (!succeeded(result)) {
      spdlog::warn("Transaction failed at instruction {}: {} ({})", index,
                   result.log, result.codespace);
      return result;
    }
  }

  for (const auto& [address, account] : working) {
    if (account == account_t{}) {
      accounts_.erase(address);
    } else {
      accounts_[address] = account;
    }
  }
  processed_signatures_.insert(transaction.signatures.front().signature);
  advance_blockhash();
  persist(working);

  spdlog::info("Committed transaction {} at slot {}",
               to_hex(transaction.signatures.front().signature), slot_);
  return make_success();
}

program_result_t ledger::verify_transaction(const transaction_t& transaction,
                                            const bytes_t& message) const {
  if (transaction.signatures.empty()) {
    return ledger_failure(program_error_code::signature_verification_failed,
                          "transaction carries no signatures");
  }

  auto signers = std::set<address_t>{};
  for (const auto& entry : transaction.signatures) {
    if (!signature_verifier_(make_bytes_view(message), entry.signer,
                             entry.signature)) {
      return ledger_failure(program_error_code::signature_verification_failed,
                            "signature of " + to_hex(entry.signer) +
                                " does not verify");
    }
    signers.insert(entry.signer);
  }

  if (!signers.contains(transaction.message.fee_payer)) {
    return ledger_failure(program_error_code::missing_required_signature,
                          "fee payer " +
                              to_hex(transaction.message.fee_payer) +
                              " did not sign");
  }
  for (const auto& instruction : transaction.message.instructions) {
    for (const auto& meta : instruction.accounts) {
      if (meta.is_signer && !signers.contains(meta.key)) {
        return ledger_failure(program_error_code::missing_required_signature,
                              "account " + to_hex(meta.key) +
                                  " is marked signer but did not sign");
      }
    }
  }

  if (transaction.message.recent_blockhash != blockhash_) {
    return ledger_failure(program_error_code::blockhash_not_found,
                          "blockhash " +
                              to_hex(transaction.message.recent_blockhash) +
                              " is not the latest");
  }
  if (processed_signatures_.contains(
          transaction.signatures.front().signature)) {
    return ledger_failure(program_error_code::already_processed,
                          "transaction was already processed");
  }
  return make_success();
}

program_result_t ledger::execute_instruction(
    const instruction_call_t& instruction,
    std::map<address_t, account_t>& working) const {
  auto program = programs_.find(instruction.program_id);
  if (program == std::end(programs_)) {
    return ledger_failure(program_error_code::program_not_found,
                          "no program at " + to_hex(instruction.program_id));
  }

  auto writable = std::set<address_t>{};
  auto before_call = std::map<address_t, account_t>{};
  for (const auto& meta : instruction.accounts) {
    if (meta.is_writable) {
      writable.insert(meta.key);
    }
    before_call.try_emplace(meta.key, working.at(meta.key));
  }
  const auto lamports_before = total_lamports(working);

  auto accounts = std::vector<coffer::program::account_info>{};
  accounts.reserve(instruction.accounts.size());
  for (const auto& meta : instruction.accounts) {
    accounts.emplace_back(meta.key, working.at(meta.key), meta.is_signer,
                          meta.is_writable);
  }

  auto effects = host_effects{};
  auto system = make_system_interface(instruction.program_id, options_);
  record_host_effects(system, effects);
  auto result = program->second(instruction.program_id, accounts,
                                make_bytes_view(instruction.data), system);
  if (!succeeded(result)) {
    return result;
  }

  if (total_lamports(working) != lamports_before) {
    return ledger_failure(program_error_code::unbalanced_transaction,
                          "instruction created or destroyed lamports");
  }
  for (const auto& [address, before] : before_call) {
    if (writable.contains(address)) {
      continue;
    }
    const auto& after = working.at(address);
    if (after.lamports != before.lamports || after.data != before.data ||
        after.owner != before.owner) {
      return ledger_failure(program_error_code::readonly_data_modified,
                            "read-only account " + to_hex(address) +
                                " was modified");
    }
  }
  // Accounts the program does not own change only through system services.
  for (const auto& [address, before] : before_call) {
    if (before.owner == instruction.program_id) {
      continue;
    }
    const auto& after = working.at(address);
    if (!effects.allocated.contains(address) &&
        (after.data != before.data || after.owner != before.owner)) {
      return ledger_failure(program_error_code::external_account_data_modified,
                            "program " + to_hex(instruction.program_id) +
                                " rewrote account " + to_hex(address) +
                                " it does not own");
    }
    auto minimum = boost::multiprecision::int128_t{before.lamports};
    if (auto flow = effects.lamport_flow.find(address);
        flow != std::end(effects.lamport_flow)) {
      minimum += flow->second;
    }
    if (boost::multiprecision::int128_t{after.lamports} < minimum) {
      return ledger_failure(program_error_code::external_account_lamport_spend,
                            "program " + to_hex(instruction.program_id) +
                                " debited account " + to_hex(address) +
                                " it does not own");
    }
  }
  return make_success();
}

account_t ledger::load_account(const address_t& address) const {
  auto it = accounts_.find(address);
  if (it == std::end(accounts_)) {
    return account_t{};
  }
  return it->second;
}

void ledger::advance_blockhash() {
  ++slot_;
  auto encoded_slot = std::array<uint8_t, sizeof(uint64_t)>{};
  boost::endian::endian_store<uint64_t, sizeof(uint64_t),
                              boost::endian::order::little>(
      encoded_slot.data(), slot_);
  blockhash_ = coffer::blake3::hasher{}
                   .update(bytes_view_t{blockhash_})
                   .update(bytes_view_t{encoded_slot})
                   .finalize();
}

void ledger::persist(const std::map<address_t, account_t>& accounts) {
  auto entries = std::vector<coffer::storage::key_value_entry_t>{};
  entries.reserve(accounts.size() + 1);
  for (const auto& [address, account] : accounts) {
    entries.emplace_back(
        make_account_key(address),
        encoder_.encode(account_row_t{account.lamports, account.owner,
                                      account.data, account.executable}));
  }
  entries.emplace_back(make_bytes(kLedgerStateKey),
                       encoder_.encode(ledger_state_row_t{slot_, blockhash_}));
  storage_.put_batch(entries);
}

void ledger::load_persisted_state() {
  spdlog::debug("Loading persisted ledger state");
  if (auto state = storage_.get<ledger_state_row_t>(
          encoder_, make_bytes_view(kLedgerStateKey))) {
    std::tie(slot_, blockhash_) = *state;
  }

  const auto rows =
      storage_.list_by_prefix(make_bytes_view(kAccountPrefix));
  for (const auto& [key, value] : rows) {
    if (key.size() != kAccountPrefix.size() + sizeof(address_t)) {
      spdlog::warn("Skipping malformed account key of {} bytes", key.size());
      continue;
    }
    auto row = encoder_.try_decode<account_row_t>(make_bytes_view(value));
    if (!row) {
      spdlog::warn("Skipping undecodable account row");
      continue;
    }
    const auto address = make_hash32(
        bytes_view_t{key}.subspan(kAccountPrefix.size(), sizeof(address_t)));
    auto account = account_t{};
    std::tie(account.lamports, account.owner, account.data,
             account.executable) = *row;
    if (account != account_t{}) {
      accounts_[address] = std::move(account);
    }
  }
}

}  // namespace coffer::ledger
