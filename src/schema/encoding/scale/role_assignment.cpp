#include <waybill/schema/encoding/scale/role_assignment.hpp>

using namespace waybill::schema;

namespace waybill::schema::encoding::scale {

void encode(role_assignment<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.user, encoder);
  encode(o.delivery_id, encoder);
  encode(o.count, encoder);
  encode(o.roles, encoder);
}

void decode(role_assignment<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.user, decoder);
  decode(o.delivery_id, decoder);
  decode(o.count, decoder);
  decode(o.roles, decoder);
}

}  // namespace waybill::schema::encoding::scale
