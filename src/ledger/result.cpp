#include <spdlog/fmt/fmt.h>
#include <waybill/ledger/result.hpp>

namespace waybill::ledger {

waybill::schema::operation_result_t make_operation_ok() {
  return waybill::schema::operation_result_t{};
}

waybill::schema::operation_result_t make_operation_error(
    waybill::schema::ledger_error_code code,
    std::string log) {
  auto result = waybill::schema::operation_result_t{};
  result.code = code;
  result.log = std::move(log);
  result.codespace = std::string{kLedgerCodespace};
  return result;
}

std::optional<waybill::schema::operation_result_t> check_length(
    std::string_view field,
    std::string_view value,
    std::size_t max_length) {
  if (value.size() <= max_length) {
    return std::nullopt;
  }
  return make_operation_error(
      waybill::schema::ledger_error_code::value_too_long,
      fmt::format("{} exceeds {} bytes", field, max_length));
}

}  // namespace waybill::ledger
