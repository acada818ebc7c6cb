#include <blake3.h>
#include <waybill/blake3/hash.hpp>

namespace waybill::blake3 {

waybill::schema::hash32_t hash(const std::string_view& str) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, str.data(), str.size());
  auto output = waybill::schema::hash32_t{};
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<waybill::schema::hash32_t>);
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace waybill::blake3
