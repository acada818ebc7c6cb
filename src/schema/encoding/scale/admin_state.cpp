#include <waybill/schema/encoding/scale/admin_state.hpp>

using namespace waybill::schema;

namespace waybill::schema::encoding::scale {

void encode(admin_state<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.owner, encoder);
  encode(o.paused, encoder);
}

void decode(admin_state<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.owner, decoder);
  decode(o.paused, decoder);
}

}  // namespace waybill::schema::encoding::scale
