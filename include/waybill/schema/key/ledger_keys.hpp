#pragma once

#include <waybill/schema/primitives.hpp>
#include <cstdint>
#include <string_view>

// Schema key type: ledger keys.
// Canonical key prefixes and key builders for every persisted ledger table.
namespace waybill::schema::key {

inline constexpr std::string_view kDeliveryKeyPrefix{"SYS|STATE|DELIVERY|"};
inline constexpr std::string_view kEventLogKeyPrefix{"SYS|STATE|EVENT_LOG|"};
inline constexpr std::string_view kRoleAssignmentKeyPrefix{
    "SYS|STATE|ROLE_ASSIGNMENT|"};
inline constexpr std::string_view kAdminStateKey{"SYS|STATE|ADMIN"};
inline constexpr std::string_view kOracleRegistryKey{"SYS|STATE|ORACLES"};

waybill::schema::bytes_t make_delivery_key(delivery_id_t delivery_id);

waybill::schema::bytes_t make_event_log_key(delivery_id_t delivery_id,
                                            sequence_t sequence);

waybill::schema::bytes_t make_role_assignment_key(const identity_t& user,
                                                  delivery_id_t delivery_id);

waybill::schema::bytes_t make_admin_state_key();
waybill::schema::bytes_t make_oracle_registry_key();

}  // namespace waybill::schema::key
