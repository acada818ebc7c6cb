#include <waybill/schema/encoding/scale/event_log_entry.hpp>

using namespace waybill::schema;

namespace waybill::schema::encoding::scale {

void encode(event_log_entry<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.logical_time, encoder);
  encode(o.latitude, encoder);
  encode(o.longitude, encoder);
  encode(o.altitude, encoder);
  encode(o.status, encoder);
  encode(o.updater, encoder);
  encode(o.note, encoder);
  encode(o.oracle_verified, encoder);
}

void decode(event_log_entry<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.logical_time, decoder);
  decode(o.latitude, decoder);
  decode(o.longitude, decoder);
  decode(o.altitude, decoder);
  decode(o.status, decoder);
  decode(o.updater, decoder);
  decode(o.note, decoder);
  decode(o.oracle_verified, decoder);
}

}  // namespace waybill::schema::encoding::scale
