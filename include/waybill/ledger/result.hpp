#pragma once

#include <waybill/schema/ledger_error_code.hpp>
#include <waybill/schema/operation_result.hpp>
#include <waybill/schema/query_result.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace waybill::ledger {

inline constexpr std::string_view kLedgerCodespace{"waybill.ledger"};
inline constexpr std::string_view kQueryCodespace{"waybill.query"};

waybill::schema::operation_result_t make_operation_ok();

waybill::schema::operation_result_t make_operation_error(
    waybill::schema::ledger_error_code code,
    std::string log);

/// value_too_long when `value` exceeds `max_length` bytes.
std::optional<waybill::schema::operation_result_t> check_length(
    std::string_view field,
    std::string_view value,
    std::size_t max_length);

template <typename T>
waybill::schema::query_result<T> make_query_value(T value) {
  auto result = waybill::schema::query_result<T>{};
  result.value = std::move(value);
  return result;
}

template <typename T>
waybill::schema::query_result<T> make_query_error(
    waybill::schema::ledger_error_code code,
    std::string log) {
  auto result = waybill::schema::query_result<T>{};
  result.code = code;
  result.log = std::move(log);
  result.codespace = std::string{kQueryCodespace};
  return result;
}

}  // namespace waybill::ledger
