#include <spdlog/spdlog.h>
#include <waybill/common/critical.hpp>
#include <waybill/ledger/result.hpp>
#include <waybill/ledger/role_registry.hpp>
#include <waybill/schema/key/ledger_keys.hpp>
#include <waybill/schema/limits.hpp>
#include <algorithm>
#include <utility>

using namespace waybill::schema;

namespace waybill::ledger {

role_registry::role_registry(ledger_context& context) : context_{context} {}

bool role_registry::has_role(std::string_view user,
                             delivery_id_t delivery_id,
                             role_id_t role) const {
  if (context_.admin().is_owner(user)) {
    return true;
  }
  auto assignment = load(user, delivery_id);
  if (!assignment) {
    return false;
  }
  auto held = std::span{assignment->roles.data(), assignment->count};
  return std::ranges::find(held, role) != std::end(held);
}

operation_result_t role_registry::assign_role(const identity_t& caller,
                                              const identity_t& user,
                                              delivery_id_t delivery_id,
                                              role_id_t role) {
  auto lock = context_.locks().acquire(delivery_id);
  if (auto error = check_mutation("assign_role", caller, user, delivery_id)) {
    return *error;
  }

  auto assignment = load(user, delivery_id).value_or(role_assignment_t{
      .user = user, .delivery_id = delivery_id});
  if (assignment.count >= kMaxRolesPerAssignment) {
    spdlog::info("Rejected assign_role '{}' to '{}' on delivery {}: {}",
                 to_string(role), user, delivery_id,
                 to_string(ledger_error_code::role_capacity_exceeded));
    return make_operation_error(ledger_error_code::role_capacity_exceeded,
                                "role set is full");
  }

  assignment.roles[assignment.count] = role;
  ++assignment.count;
  auto key = key::make_role_assignment_key(user, delivery_id);
  context_.storage().put(context_.encoder(), make_bytes_view(key), assignment);
  spdlog::debug("Assigned role '{}' to '{}' on delivery {}", to_string(role),
                user, delivery_id);
  return make_operation_ok();
}

operation_result_t role_registry::remove_role(const identity_t& caller,
                                              const identity_t& user,
                                              delivery_id_t delivery_id,
                                              role_id_t role) {
  auto lock = context_.locks().acquire(delivery_id);
  if (auto error = check_mutation("remove_role", caller, user, delivery_id)) {
    return *error;
  }

  auto assignment = load(user, delivery_id);
  if (!assignment) {
    return make_operation_ok();
  }

  auto next = role_assignment_t{.user = assignment->user,
                                .delivery_id = assignment->delivery_id};
  for (auto i = std::size_t{0}; i < assignment->count; ++i) {
    if (assignment->roles[i] != role) {
      next.roles[next.count++] = assignment->roles[i];
    }
  }
  if (next.count == assignment->count) {
    return make_operation_ok();
  }

  auto key = key::make_role_assignment_key(user, delivery_id);
  context_.storage().put(context_.encoder(), make_bytes_view(key), next);
  spdlog::debug("Removed role '{}' from '{}' on delivery {}", to_string(role),
                user, delivery_id);
  return make_operation_ok();
}

std::vector<role_id_t> role_registry::roles_for(
    std::string_view user,
    delivery_id_t delivery_id) const {
  auto assignment = load(user, delivery_id);
  if (!assignment) {
    return {};
  }
  return {std::begin(assignment->roles),
          std::begin(assignment->roles) + assignment->count};
}

std::vector<waybill::storage::key_value_entry_t>
role_registry::make_initial_assignments(delivery_id_t delivery_id,
                                        const identity_t& creator,
                                        const identity_t& operator_id,
                                        const identity_t& supplier_id,
                                        const identity_t& recipient_id) const {
  auto grants = std::vector<std::pair<identity_t, role_id_t>>{};
  auto grant = [&grants](const identity_t& user, role_id_t role) {
    auto existing = std::ranges::find_if(
        grants, [&user](const auto& entry) { return entry.first == user; });
    if (existing != std::end(grants)) {
      existing->second = role;
      return;
    }
    grants.emplace_back(user, role);
  };
  grant(creator, role_id_t::admin);
  grant(operator_id, role_id_t::operator_);
  grant(supplier_id, role_id_t::supplier);
  grant(recipient_id, role_id_t::recipient);

  auto entries = std::vector<waybill::storage::key_value_entry_t>{};
  entries.reserve(grants.size());
  for (const auto& [user, role] : grants) {
    auto assignment =
        role_assignment_t{.user = user, .delivery_id = delivery_id, .count = 1};
    assignment.roles[0] = role;
    entries.emplace_back(key::make_role_assignment_key(user, delivery_id),
                         context_.encoder().encode(assignment));
  }
  return entries;
}

std::optional<role_assignment_t> role_registry::load(
    std::string_view user,
    delivery_id_t delivery_id) const {
  auto key = key::make_role_assignment_key(identity_t{user}, delivery_id);
  auto assignment = context_.storage().get<role_assignment_t>(
      context_.encoder(), make_bytes_view(key));
  if (assignment && assignment->count > kMaxRolesPerAssignment) {
    waybill::common::critical("Stored role assignment exceeds role capacity");
  }
  return assignment;
}

std::optional<operation_result_t> role_registry::check_mutation(
    std::string_view operation,
    const identity_t& caller,
    const identity_t& user,
    delivery_id_t delivery_id) const {
  auto delivery_key = key::make_delivery_key(delivery_id);
  if (!context_.storage().contains(make_bytes_view(delivery_key))) {
    spdlog::info("Rejected {} on delivery {}: {}", operation, delivery_id,
                 to_string(ledger_error_code::not_found));
    return make_operation_error(ledger_error_code::not_found,
                                "delivery does not exist");
  }
  if (auto error = check_length("caller", caller, kMaxIdentityLength)) {
    return error;
  }
  if (auto error = check_length("user", user, kMaxIdentityLength)) {
    return error;
  }
  if (!has_role(caller, delivery_id, role_id_t::admin)) {
    spdlog::info("Rejected {} from '{}' on delivery {}: {}", operation, caller,
                 delivery_id, to_string(ledger_error_code::unauthorized));
    return make_operation_error(ledger_error_code::unauthorized,
                                "caller does not hold admin for delivery");
  }
  return std::nullopt;
}

}  // namespace waybill::ledger
