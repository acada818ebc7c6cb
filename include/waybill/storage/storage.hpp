#pragma once
#include <waybill/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace waybill::storage {

using key_value_entry_t =
    std::pair<waybill::schema::bytes_t, waybill::schema::bytes_t>;

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const waybill::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const waybill::schema::bytes_view_t& key,
           const T& value) const;

  /// True when a value is stored at key.
  bool contains(const waybill::schema::bytes_view_t& key) const;

  /// Persist all entries in one atomic write; readers see all or none.
  void write_batch(const std::vector<key_value_entry_t>& entries) const;

  /// Return all key-value pairs that share the provided key prefix, in key
  /// order.
  std::vector<key_value_entry_t> list_by_prefix(
      const waybill::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace waybill::storage
