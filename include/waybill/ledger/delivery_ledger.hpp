#pragma once

#include <waybill/ledger/ledger_context.hpp>
#include <waybill/ledger/role_registry.hpp>
#include <waybill/schema/delivery_record.hpp>
#include <waybill/schema/operation_result.hpp>
#include <waybill/schema/primitives.hpp>
#include <optional>
#include <string_view>

namespace waybill::ledger {

/// Delivery records and their append-only event logs.
///
/// Every mutation holds the delivery's lock from the lookup through the
/// storage write. All checks run before anything is written and each
/// accepted mutation commits as a single storage batch, so a rejected call
/// leaves no trace.
class delivery_ledger final {
 public:
  delivery_ledger(ledger_context& context, role_registry& roles);

  /// Create a pending delivery and its four initial role assignments.
  ///
  /// Fails already_initialized when the id is taken and paused while the
  /// ledger is paused. Open to any caller.
  waybill::schema::operation_result_t initialize_delivery(
      const waybill::schema::identity_t& caller,
      waybill::schema::delivery_id_t delivery_id,
      const waybill::schema::identity_t& operator_id,
      const waybill::schema::identity_t& supplier_id,
      const waybill::schema::identity_t& recipient_id,
      waybill::schema::logical_time_t expected_arrival,
      const waybill::schema::payload_fingerprint_t& payload_fingerprint);

  /// Append a status/location update and move the delivery to `status`.
  ///
  /// Callers must hold operator for the delivery or be a registered oracle;
  /// entries written by oracles are marked oracle-verified. A terminal status
  /// completes the delivery. On success `sequence` carries the new entry's
  /// sequence number.
  waybill::schema::operation_result_t log_event(
      const waybill::schema::identity_t& caller,
      waybill::schema::delivery_id_t delivery_id,
      std::string_view latitude,
      std::string_view longitude,
      waybill::schema::altitude_t altitude,
      std::string_view status,
      std::string_view note);

  /// Force the delivery to failed with a reason. Operator role only; oracle
  /// membership does not authorize. Appends no event.
  waybill::schema::operation_result_t log_failure(
      const waybill::schema::identity_t& caller,
      waybill::schema::delivery_id_t delivery_id,
      std::string_view reason);

 private:
  std::optional<waybill::schema::delivery_record_t> load(
      waybill::schema::delivery_id_t delivery_id) const;

  /// not_found, paused and already_completed, in that order.
  std::optional<waybill::schema::operation_result_t> check_writable(
      std::string_view operation,
      waybill::schema::delivery_id_t delivery_id,
      const std::optional<waybill::schema::delivery_record_t>& record) const;

  ledger_context& context_;
  role_registry& roles_;
};

}  // namespace waybill::ledger
