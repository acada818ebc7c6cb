#pragma once
#include <waybill/schema/primitives.hpp>
#include <string_view>

namespace waybill::blake3 {

waybill::schema::hash32_t hash(const std::string_view& str);

}  // namespace waybill::blake3
