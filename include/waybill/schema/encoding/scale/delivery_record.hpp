#pragma once
#include <waybill/schema/delivery_record.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace waybill::schema::encoding::scale {

void encode(delivery_record<1>&& o, ::scale::Encoder& encoder);
void decode(delivery_record<1>&& o, ::scale::Decoder& decoder);

}  // namespace waybill::schema::encoding::scale
