#pragma once
#include <coffer/schema/primitives.hpp>
#include <optional>

namespace coffer::schema::encoding {

/// Serialization backend selected at build time by `Library`.
///
/// Used for host-side data only (transaction messages, ledger rows). The
/// vault record has its own fixed layout and never goes through an encoder.
template <typename Library>
struct encoder {
  template <typename T>
  coffer::schema::bytes_t encode(const T& obj);

  template <typename T>
  T decode(const coffer::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const coffer::schema::bytes_view_t& bytes);
};

}  // namespace coffer::schema::encoding
