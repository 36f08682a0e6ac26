#pragma once
#include <blake3.h>
#include <coffer/schema/primitives.hpp>
#include <string_view>

namespace coffer::blake3 {

/// Incremental BLAKE3 over any number of byte slices.
class hasher final {
 public:
  hasher();

  hasher& update(const coffer::schema::bytes_view_t& bytes);
  hasher& update(const std::string_view& str);

  /// Digest of everything updated so far; the hasher stays usable.
  coffer::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_;
};

coffer::schema::hash32_t hash(const std::string_view& str);
coffer::schema::hash32_t hash(const coffer::schema::bytes_view_t& bytes);

}  // namespace coffer::blake3
