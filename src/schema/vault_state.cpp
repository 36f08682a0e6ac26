#include <coffer/schema/vault_state.hpp>

#include <algorithm>
#include <iterator>

namespace coffer::schema {

namespace {

bool has_vault_discriminator(const bytes_view_t& data) {
  return std::equal(std::begin(kVaultDiscriminator),
                    std::end(kVaultDiscriminator), std::begin(data));
}

}  // namespace

std::optional<vault_state> vault_state::load(mutable_bytes_view_t data) {
  if (data.size() != kVaultStateSize) {
    return std::nullopt;
  }
  if (!has_vault_discriminator(bytes_view_t{data.data(), data.size()})) {
    return std::nullopt;
  }
  return vault_state{reinterpret_cast<vault_layout_t*>(data.data())};
}

std::optional<vault_state> vault_state::initialize(mutable_bytes_view_t data,
                                                   const address_t& authority) {
  if (data.size() != kVaultStateSize) {
    return std::nullopt;
  }
  auto* layout = reinterpret_cast<vault_layout_t*>(data.data());
  layout->discriminator = kVaultDiscriminator;
  layout->authority = authority;
  layout->balance = lamports_t{0};
  return vault_state{layout};
}

std::optional<vault_record_t> read_vault_record(const bytes_view_t& data) {
  if (data.size() != kVaultStateSize || !has_vault_discriminator(data)) {
    return std::nullopt;
  }
  const auto* layout = reinterpret_cast<const vault_layout_t*>(data.data());
  return vault_record_t{.authority = layout->authority,
                        .balance = layout->balance.value()};
}

}  // namespace coffer::schema
