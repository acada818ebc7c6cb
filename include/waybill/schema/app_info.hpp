#pragma once

#include <waybill/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace waybill::schema {

template <uint16_t Version>
struct app_info;

template <>
struct app_info<1> final {
  uint16_t schema_version{1};
  std::string data{"waybill-ledger"};
  std::string version{"0.1.0"};
  uint64_t app_version{1};
  logical_time_t logical_time{};
};

using app_info_t = app_info<1>;

}  // namespace waybill::schema
