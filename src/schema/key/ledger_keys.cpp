#include <waybill/schema/key/builder.hpp>
#include <waybill/schema/key/ledger_keys.hpp>

namespace waybill::schema::key {

waybill::schema::bytes_t make_delivery_key(const delivery_id_t delivery_id) {
  auto key = builder{};
  key.write(kDeliveryKeyPrefix).write(delivery_id);
  return key.data;
}

waybill::schema::bytes_t make_event_log_key(const delivery_id_t delivery_id,
                                            const sequence_t sequence) {
  auto key = builder{};
  key.write(kEventLogKeyPrefix).write(delivery_id).write(sequence);
  return key.data;
}

waybill::schema::bytes_t make_role_assignment_key(
    const identity_t& user,
    const delivery_id_t delivery_id) {
  auto key = builder{};
  key.write(kRoleAssignmentKeyPrefix).write(delivery_id).hash(user);
  return key.data;
}

waybill::schema::bytes_t make_admin_state_key() {
  return waybill::schema::make_bytes(kAdminStateKey);
}

waybill::schema::bytes_t make_oracle_registry_key() {
  return waybill::schema::make_bytes(kOracleRegistryKey);
}

}  // namespace waybill::schema::key
