#pragma once

#include <waybill/ledger/ledger_context.hpp>
#include <waybill/schema/operation_result.hpp>
#include <waybill/schema/role_assignment.hpp>
#include <waybill/schema/role_id.hpp>
#include <waybill/storage/storage.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace waybill::ledger {

/// Per-(user, delivery) capability sets.
class role_registry final {
 public:
  explicit role_registry(ledger_context& context);

  /// True when `user` is the global owner or holds `role` for the delivery.
  bool has_role(std::string_view user,
                waybill::schema::delivery_id_t delivery_id,
                waybill::schema::role_id_t role) const;

  /// Append `role` to the user's set. Caller must hold admin for the
  /// delivery; duplicates are kept and the set holds at most five entries.
  waybill::schema::operation_result_t assign_role(
      const waybill::schema::identity_t& caller,
      const waybill::schema::identity_t& user,
      waybill::schema::delivery_id_t delivery_id,
      waybill::schema::role_id_t role);

  /// Remove every occurrence of `role`. Absent roles are a no-op.
  waybill::schema::operation_result_t remove_role(
      const waybill::schema::identity_t& caller,
      const waybill::schema::identity_t& user,
      waybill::schema::delivery_id_t delivery_id,
      waybill::schema::role_id_t role);

  /// Stored roles in insertion order; empty when no assignment exists.
  std::vector<waybill::schema::role_id_t> roles_for(
      std::string_view user,
      waybill::schema::delivery_id_t delivery_id) const;

  /// Storage rows for the assignments created alongside a new delivery.
  ///
  /// Grants creator->admin, operator->operator, supplier->supplier and
  /// recipient->recipient, in that order. An identity named more than once
  /// keeps only the role written last.
  std::vector<waybill::storage::key_value_entry_t> make_initial_assignments(
      waybill::schema::delivery_id_t delivery_id,
      const waybill::schema::identity_t& creator,
      const waybill::schema::identity_t& operator_id,
      const waybill::schema::identity_t& supplier_id,
      const waybill::schema::identity_t& recipient_id) const;

 private:
  std::optional<waybill::schema::role_assignment_t> load(
      std::string_view user,
      waybill::schema::delivery_id_t delivery_id) const;

  /// Shared prologue of assign/remove: existence, bounds, admin check.
  std::optional<waybill::schema::operation_result_t> check_mutation(
      std::string_view operation,
      const waybill::schema::identity_t& caller,
      const waybill::schema::identity_t& user,
      waybill::schema::delivery_id_t delivery_id) const;

  ledger_context& context_;
};

}  // namespace waybill::ledger
