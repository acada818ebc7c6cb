#pragma once
#include <waybill/schema/primitives.hpp>
#include <vector>

namespace waybill::schema {

template <uint16_t Version>
struct oracle_registry_state;

template <>
struct oracle_registry_state<1> final {
  uint16_t version{1};
  std::vector<identity_t> oracles;
};

using oracle_registry_state_t = oracle_registry_state<1>;

}  // namespace waybill::schema
