#pragma once

#include <waybill/ledger/ledger_context.hpp>
#include <waybill/ledger/role_registry.hpp>
#include <waybill/schema/app_info.hpp>
#include <waybill/schema/delivery_record.hpp>
#include <waybill/schema/event_log_entry.hpp>
#include <waybill/schema/query_result.hpp>
#include <waybill/schema/role_id.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace waybill::ledger {

/// Read-only projections over ledger state. Never takes a delivery lock;
/// each accepted mutation is one atomic batch, so reads see whole states.
class query_service final {
 public:
  query_service(ledger_context& context, const role_registry& roles);

  /// Empty value when the delivery does not exist.
  waybill::schema::query_result<waybill::schema::delivery_record_t>
  get_delivery_details(waybill::schema::delivery_id_t delivery_id) const;

  /// Empty value when no entry exists at (delivery, sequence).
  waybill::schema::query_result<waybill::schema::event_log_entry_t>
  get_event_log(waybill::schema::delivery_id_t delivery_id,
                waybill::schema::sequence_t sequence) const;

  /// not_found when the delivery does not exist.
  waybill::schema::query_result<waybill::schema::sequence_t>
  get_latest_sequence(waybill::schema::delivery_id_t delivery_id) const;

  /// not_found when the delivery does not exist.
  waybill::schema::query_result<bool> is_delivery_completed(
      waybill::schema::delivery_id_t delivery_id) const;

  /// not_found when the delivery does not exist; empty value when it was
  /// never force-failed.
  waybill::schema::query_result<std::string> get_failure_reason(
      waybill::schema::delivery_id_t delivery_id) const;

  waybill::schema::query_result<std::vector<waybill::schema::identity_t>>
  get_oracles() const;
  waybill::schema::query_result<bool> get_contract_paused() const;
  waybill::schema::query_result<waybill::schema::identity_t>
  get_contract_owner() const;

  waybill::schema::query_result<bool> has_role(
      std::string_view user,
      waybill::schema::delivery_id_t delivery_id,
      waybill::schema::role_id_t role) const;

  waybill::schema::query_result<std::vector<waybill::schema::role_id_t>>
  get_roles(std::string_view user,
            waybill::schema::delivery_id_t delivery_id) const;

  /// Application name, version and current logical time.
  waybill::schema::app_info_t info() const;

 private:
  std::optional<waybill::schema::delivery_record_t> load(
      waybill::schema::delivery_id_t delivery_id) const;

  ledger_context& context_;
  const role_registry& roles_;
};

}  // namespace waybill::ledger
