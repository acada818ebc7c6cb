#pragma once
#include <waybill/schema/role_assignment.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace waybill::schema::encoding::scale {

void encode(role_assignment<1>&& o, ::scale::Encoder& encoder);
void decode(role_assignment<1>&& o, ::scale::Decoder& decoder);

}  // namespace waybill::schema::encoding::scale
