#pragma once
#include <waybill/schema/primitives.hpp>

namespace waybill::schema {

template <uint16_t Version>
struct admin_state;

template <>
struct admin_state<1> final {
  uint16_t version{1};
  identity_t owner;
  bool paused{};
};

using admin_state_t = admin_state<1>;

}  // namespace waybill::schema
