#pragma once
#include <cstdint>

namespace coffer::ledger {

/// Rent parameters of the local ledger. An account is kept only while it
/// holds `minimum_balance` for its size, computed as
/// `(account_storage_overhead + space) * lamports_per_byte_year *
/// exemption_threshold_years`.
struct ledger_options final {
  uint64_t lamports_per_byte_year{3480};
  uint64_t exemption_threshold_years{2};
  uint64_t account_storage_overhead{128};
};

}  // namespace coffer::ledger
