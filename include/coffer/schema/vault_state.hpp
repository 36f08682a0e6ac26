#pragma once
#include <boost/endian/buffers.hpp>
#include <coffer/schema/primitives.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <type_traits>

// Schema type: vault state.
// Custody workflow: The persisted record of one authority's vault. The record
// lives in the data of a program owned account and is read and written in
// place.
namespace coffer::schema {

inline constexpr auto kVaultDiscriminator =
    std::array<uint8_t, 8>{0x56, 0x61, 0x75, 0x6c, 0x74, 0x21, 0x21, 0x21};

/// Domain seed of every vault address.
inline constexpr auto kVaultSeed = std::string_view{"vault"};

/// Byte layout of the record. All members are byte arrays, so the struct has
/// alignment 1 and can overlay any account buffer.
struct vault_layout_t final {
  std::array<uint8_t, 8> discriminator;
  address_t authority;
  boost::endian::little_uint64_buf_t balance;
};

inline constexpr auto kVaultDiscriminatorOffset = std::size_t{0};
inline constexpr auto kVaultAuthorityOffset = std::size_t{8};
inline constexpr auto kVaultBalanceOffset = std::size_t{40};
inline constexpr auto kVaultStateSize = std::size_t{48};

static_assert(std::is_standard_layout_v<vault_layout_t>);
static_assert(alignof(vault_layout_t) == 1);
static_assert(sizeof(vault_layout_t) == kVaultStateSize);
static_assert(offsetof(vault_layout_t, discriminator) ==
              kVaultDiscriminatorOffset);
static_assert(offsetof(vault_layout_t, authority) == kVaultAuthorityOffset);
static_assert(offsetof(vault_layout_t, balance) == kVaultBalanceOffset);

/// Validated, non-owning view over a vault record.
///
/// `load` and `initialize` are the only ways to obtain one. The view points at
/// the caller's buffer, so the buffer must outlive it and must not be resized
/// while it is in use.
class vault_state final {
 public:
  /// View `data` as a vault record.
  ///
  /// Returns std::nullopt unless `data` is exactly `kVaultStateSize` bytes and
  /// starts with `kVaultDiscriminator`.
  static std::optional<vault_state> load(mutable_bytes_view_t data);

  /// Write a fresh record (discriminator, authority, zero balance) into a
  /// newly allocated buffer and return a view over it.
  ///
  /// Returns std::nullopt without writing when `data` is not exactly
  /// `kVaultStateSize` bytes.
  static std::optional<vault_state> initialize(mutable_bytes_view_t data,
                                               const address_t& authority);

  const address_t& authority() const { return layout_->authority; }
  lamports_t balance() const { return layout_->balance.value(); }
  void set_balance(const lamports_t value) { layout_->balance = value; }

 private:
  explicit vault_state(vault_layout_t* layout) : layout_{layout} {}

  vault_layout_t* layout_;
};

/// Copied-out record fields for readers outside the program.
struct vault_record_t final {
  address_t authority{};
  lamports_t balance{};
};

/// Decode a record from account data with the same validation as
/// `vault_state::load`.
std::optional<vault_record_t> read_vault_record(const bytes_view_t& data);

}  // namespace coffer::schema
