#pragma once
#include <waybill/schema/delivery_status.hpp>
#include <waybill/schema/primitives.hpp>
#include <optional>
#include <string>

// Schema type: delivery record.
// One row per delivery id. Invariant: completed iff status is terminal; once
// completed, status/sequence/completed never change again.
namespace waybill::schema {

template <uint16_t Version>
struct delivery_record;

template <>
struct delivery_record<1> final {
  uint16_t version{1};
  delivery_status_t status{delivery_status_t::pending};
  identity_t operator_id;
  identity_t supplier_id;
  identity_t recipient_id;
  logical_time_t start_time{};
  logical_time_t expected_arrival{};
  std::optional<logical_time_t> actual_arrival;
  payload_fingerprint_t payload_fingerprint{};
  sequence_t sequence{};
  bool completed{};
  std::optional<std::string> failure_reason;
};

using delivery_record_t = delivery_record<1>;

}  // namespace waybill::schema
