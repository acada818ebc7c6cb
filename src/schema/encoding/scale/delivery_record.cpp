#include <waybill/schema/encoding/scale/delivery_record.hpp>

using namespace waybill::schema;

namespace waybill::schema::encoding::scale {

void encode(delivery_record<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.status, encoder);
  encode(o.operator_id, encoder);
  encode(o.supplier_id, encoder);
  encode(o.recipient_id, encoder);
  encode(o.start_time, encoder);
  encode(o.expected_arrival, encoder);
  encode(o.actual_arrival, encoder);
  encode(o.payload_fingerprint, encoder);
  encode(o.sequence, encoder);
  encode(o.completed, encoder);
  encode(o.failure_reason, encoder);
}

void decode(delivery_record<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.status, decoder);
  decode(o.operator_id, decoder);
  decode(o.supplier_id, decoder);
  decode(o.recipient_id, decoder);
  decode(o.start_time, decoder);
  decode(o.expected_arrival, decoder);
  decode(o.actual_arrival, decoder);
  decode(o.payload_fingerprint, decoder);
  decode(o.sequence, decoder);
  decode(o.completed, decoder);
  decode(o.failure_reason, decoder);
}

}  // namespace waybill::schema::encoding::scale
