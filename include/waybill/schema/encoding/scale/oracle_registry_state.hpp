#pragma once
#include <waybill/schema/oracle_registry_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace waybill::schema::encoding::scale {

void encode(oracle_registry_state<1>&& o, ::scale::Encoder& encoder);
void decode(oracle_registry_state<1>&& o, ::scale::Decoder& decoder);

}  // namespace waybill::schema::encoding::scale
