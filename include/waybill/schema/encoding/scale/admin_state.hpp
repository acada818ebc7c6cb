#pragma once
#include <waybill/schema/admin_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace waybill::schema::encoding::scale {

void encode(admin_state<1>&& o, ::scale::Encoder& encoder);
void decode(admin_state<1>&& o, ::scale::Decoder& decoder);

}  // namespace waybill::schema::encoding::scale
