#include <boost/endian/conversion.hpp>
#include <waybill/blake3/hash.hpp>
#include <waybill/schema/key/builder.hpp>
#include <algorithm>
#include <iterator>

using namespace waybill::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const uint64_t value) {
  auto big = boost::endian::native_to_big(value);
  auto* raw = reinterpret_cast<const uint8_t*>(&big);
  std::ranges::copy_n(raw, sizeof(big), std::back_inserter(data));
  return *this;
}

builder& builder::hash(const std::string_view& str) {
  auto digest = waybill::blake3::hash(str);
  return write(std::span<const uint8_t>{digest.data(), digest.size()});
}
