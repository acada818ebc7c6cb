#pragma once
#include <waybill/schema/limits.hpp>
#include <waybill/schema/primitives.hpp>
#include <waybill/schema/role_id.hpp>
#include <array>

namespace waybill::schema {

template <uint16_t Version>
struct role_assignment;

/// Roles held by `user` for one delivery. Only the first `count` slots are
/// meaningful; duplicates are kept in insertion order.
template <>
struct role_assignment<1> final {
  uint16_t version{1};
  identity_t user;
  delivery_id_t delivery_id{};
  uint8_t count{};
  std::array<role_id_t, kMaxRolesPerAssignment> roles{};
};

using role_assignment_t = role_assignment<1>;

}  // namespace waybill::schema
