#pragma once
#include <waybill/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace waybill::schema::key {

/// Appends key components in a fixed layout. Integers are written
/// big-endian so RocksDB's bytewise order matches numeric order.
struct builder final {
  waybill::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);
  builder& write(uint64_t value);

  /// Append the BLAKE3 digest of `str`; keeps variable-length identities
  /// from colliding with neighbouring key components.
  builder& hash(const std::string_view& str);
};

}  // namespace waybill::schema::key
