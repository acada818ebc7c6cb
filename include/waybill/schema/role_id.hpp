#pragma once

#include <waybill/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: role id.
// Per-delivery capabilities. Numeric values are part of the RPC contract.
namespace waybill::schema {

enum class role_id_t : uint8_t {
  operator_ = 1,
  oracle = 2,
  admin = 3,
  supplier = 4,
  recipient = 5
};

inline constexpr auto kRoleIdMappings = std::array{
    std::pair<std::string_view, role_id_t>{"operator", role_id_t::operator_},
    std::pair<std::string_view, role_id_t>{"oracle", role_id_t::oracle},
    std::pair<std::string_view, role_id_t>{"admin", role_id_t::admin},
    std::pair<std::string_view, role_id_t>{"supplier", role_id_t::supplier},
    std::pair<std::string_view, role_id_t>{"recipient", role_id_t::recipient},
};

template <>
inline std::optional<role_id_t> try_from_string<role_id_t>(
    const std::string_view value) {
  return from_string(value, kRoleIdMappings);
}

inline constexpr std::string_view to_string(const role_id_t value) {
  return to_string(value, kRoleIdMappings).value_or("unknown");
}

inline constexpr std::optional<role_id_t> try_make_role_id(
    const uint32_t value) {
  for (const auto& [name, role] : kRoleIdMappings) {
    if (static_cast<uint32_t>(role) == value) {
      return role;
    }
  }
  return std::nullopt;
}

}  // namespace waybill::schema
