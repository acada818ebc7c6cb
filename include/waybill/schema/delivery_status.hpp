#pragma once

#include <waybill/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: delivery status.
// Delivery lifecycle: pending is the only initial state; delivered, failed
// and cancelled are terminal. Any status may follow any non-terminal status.
namespace waybill::schema {

enum class delivery_status_t : uint8_t {
  pending = 0,
  assigned = 1,
  in_transit = 2,
  delayed = 3,
  arrived = 4,
  delivered = 5,
  failed = 6,
  cancelled = 7
};

inline constexpr auto kDeliveryStatusMappings = std::array{
    std::pair<std::string_view, delivery_status_t>{"pending",
                                                   delivery_status_t::pending},
    std::pair<std::string_view, delivery_status_t>{
        "assigned", delivery_status_t::assigned},
    std::pair<std::string_view, delivery_status_t>{
        "in-transit", delivery_status_t::in_transit},
    std::pair<std::string_view, delivery_status_t>{"delayed",
                                                   delivery_status_t::delayed},
    std::pair<std::string_view, delivery_status_t>{"arrived",
                                                   delivery_status_t::arrived},
    std::pair<std::string_view, delivery_status_t>{
        "delivered", delivery_status_t::delivered},
    std::pair<std::string_view, delivery_status_t>{"failed",
                                                   delivery_status_t::failed},
    std::pair<std::string_view, delivery_status_t>{
        "cancelled", delivery_status_t::cancelled},
};

template <>
inline std::optional<delivery_status_t> try_from_string<delivery_status_t>(
    const std::string_view value) {
  return from_string(value, kDeliveryStatusMappings);
}

inline constexpr std::string_view to_string(const delivery_status_t value) {
  return to_string(value, kDeliveryStatusMappings).value_or("unknown");
}

inline constexpr bool is_terminal(const delivery_status_t value) {
  return value == delivery_status_t::delivered ||
         value == delivery_status_t::failed ||
         value == delivery_status_t::cancelled;
}

}  // namespace waybill::schema
