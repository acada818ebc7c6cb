#pragma once
#include <waybill/schema/delivery_status.hpp>
#include <waybill/schema/primitives.hpp>
#include <string>

// Schema type: event log entry.
// Immutable once written; keyed by (delivery id, sequence).
namespace waybill::schema {

template <uint16_t Version>
struct event_log_entry;

template <>
struct event_log_entry<1> final {
  uint16_t version{1};
  logical_time_t logical_time{};
  std::string latitude;
  std::string longitude;
  altitude_t altitude{};
  delivery_status_t status{delivery_status_t::pending};
  identity_t updater;
  std::string note;
  bool oracle_verified{};
};

using event_log_entry_t = event_log_entry<1>;

}  // namespace waybill::schema
