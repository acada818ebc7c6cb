#include <waybill/schema/encoding/scale/oracle_registry_state.hpp>

using namespace waybill::schema;

namespace waybill::schema::encoding::scale {

void encode(oracle_registry_state<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.oracles, encoder);
}

void decode(oracle_registry_state<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.oracles, decoder);
}

}  // namespace waybill::schema::encoding::scale
