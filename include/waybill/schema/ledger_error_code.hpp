#pragma once

#include <waybill/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace waybill::schema {

enum class ledger_error_code : uint32_t {
  ok = 0,
  unauthorized = 100,
  not_found = 101,
  invalid_status = 102,
  invalid_coordinates = 103,
  // Reserved; no operation reports it yet.
  sequence_mismatch = 104,
  already_completed = 105,
  invalid_payload_fingerprint = 106,
  oracle_capacity_exceeded = 107,
  paused = 108,
  // Reserved; expected arrival is accepted as given.
  invalid_timestamp = 109,
  log_limit_exceeded = 110,
  role_capacity_exceeded = 111,
  already_initialized = 112,
  value_too_long = 113,
  invalid_role = 114,
};

inline constexpr auto kLedgerErrorCodeMappings = std::array{
    std::pair<std::string_view, ledger_error_code>{"ok",
                                                   ledger_error_code::ok},
    std::pair<std::string_view, ledger_error_code>{
        "unauthorized", ledger_error_code::unauthorized},
    std::pair<std::string_view, ledger_error_code>{
        "not_found", ledger_error_code::not_found},
    std::pair<std::string_view, ledger_error_code>{
        "invalid_status", ledger_error_code::invalid_status},
    std::pair<std::string_view, ledger_error_code>{
        "invalid_coordinates", ledger_error_code::invalid_coordinates},
    std::pair<std::string_view, ledger_error_code>{
        "sequence_mismatch", ledger_error_code::sequence_mismatch},
    std::pair<std::string_view, ledger_error_code>{
        "already_completed", ledger_error_code::already_completed},
    std::pair<std::string_view, ledger_error_code>{
        "invalid_payload_fingerprint",
        ledger_error_code::invalid_payload_fingerprint},
    std::pair<std::string_view, ledger_error_code>{
        "oracle_capacity_exceeded",
        ledger_error_code::oracle_capacity_exceeded},
    std::pair<std::string_view, ledger_error_code>{"paused",
                                                   ledger_error_code::paused},
    std::pair<std::string_view, ledger_error_code>{
        "invalid_timestamp", ledger_error_code::invalid_timestamp},
    std::pair<std::string_view, ledger_error_code>{
        "log_limit_exceeded", ledger_error_code::log_limit_exceeded},
    std::pair<std::string_view, ledger_error_code>{
        "role_capacity_exceeded", ledger_error_code::role_capacity_exceeded},
    std::pair<std::string_view, ledger_error_code>{
        "already_initialized", ledger_error_code::already_initialized},
    std::pair<std::string_view, ledger_error_code>{
        "value_too_long", ledger_error_code::value_too_long},
    std::pair<std::string_view, ledger_error_code>{
        "invalid_role", ledger_error_code::invalid_role},
};

inline constexpr std::string_view to_string(const ledger_error_code value) {
  return to_string(value, kLedgerErrorCodeMappings).value_or("unknown");
}

}  // namespace waybill::schema
