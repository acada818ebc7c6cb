#pragma once
#include <waybill/schema/primitives.hpp>
#include <optional>
#include <span>

namespace waybill::schema::encoding {

// The codec is chosen at build time by tag; there is exactly one
// (SCALE) today. Storage and key helpers are templated on it so a second
// codec only needs a new specialization.
template <typename Library>
struct encoder {
  template <typename T>
  waybill::schema::bytes_t encode(const T& obj);

  template <typename T>
  T decode(const waybill::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const waybill::schema::bytes_view_t& bytes);
};

}  // namespace waybill::schema::encoding
