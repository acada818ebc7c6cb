#pragma once
#include <waybill/schema/event_log_entry.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace waybill::schema::encoding::scale {

void encode(event_log_entry<1>&& o, ::scale::Encoder& encoder);
void decode(event_log_entry<1>&& o, ::scale::Decoder& decoder);

}  // namespace waybill::schema::encoding::scale
