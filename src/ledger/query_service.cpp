#include <waybill/ledger/query_service.hpp>
#include <waybill/ledger/result.hpp>
#include <waybill/schema/key/ledger_keys.hpp>

using namespace waybill::schema;

namespace waybill::ledger {

query_service::query_service(ledger_context& context,
                             const role_registry& roles)
    : context_{context}, roles_{roles} {}

query_result<delivery_record_t> query_service::get_delivery_details(
    delivery_id_t delivery_id) const {
  auto result = query_result<delivery_record_t>{};
  result.value = load(delivery_id);
  return result;
}

query_result<event_log_entry_t> query_service::get_event_log(
    delivery_id_t delivery_id,
    sequence_t sequence) const {
  auto key = key::make_event_log_key(delivery_id, sequence);
  auto result = query_result<event_log_entry_t>{};
  result.value = context_.storage().get<event_log_entry_t>(
      context_.encoder(), make_bytes_view(key));
  return result;
}

query_result<sequence_t> query_service::get_latest_sequence(
    delivery_id_t delivery_id) const {
  auto record = load(delivery_id);
  if (!record) {
    return make_query_error<sequence_t>(ledger_error_code::not_found,
                                        "delivery does not exist");
  }
  return make_query_value(record->sequence);
}

query_result<bool> query_service::is_delivery_completed(
    delivery_id_t delivery_id) const {
  auto record = load(delivery_id);
  if (!record) {
    return make_query_error<bool>(ledger_error_code::not_found,
                                  "delivery does not exist");
  }
  return make_query_value(record->completed);
}

query_result<std::string> query_service::get_failure_reason(
    delivery_id_t delivery_id) const {
  auto record = load(delivery_id);
  if (!record) {
    return make_query_error<std::string>(ledger_error_code::not_found,
                                         "delivery does not exist");
  }
  auto result = query_result<std::string>{};
  result.value = std::move(record->failure_reason);
  return result;
}

query_result<std::vector<identity_t>> query_service::get_oracles() const {
  return make_query_value(context_.oracles().oracles());
}

query_result<bool> query_service::get_contract_paused() const {
  return make_query_value(context_.admin().is_paused());
}

query_result<identity_t> query_service::get_contract_owner() const {
  return make_query_value(context_.admin().owner());
}

query_result<bool> query_service::has_role(std::string_view user,
                                           delivery_id_t delivery_id,
                                           role_id_t role) const {
  return make_query_value(roles_.has_role(user, delivery_id, role));
}

query_result<std::vector<role_id_t>> query_service::get_roles(
    std::string_view user,
    delivery_id_t delivery_id) const {
  return make_query_value(roles_.roles_for(user, delivery_id));
}

app_info_t query_service::info() const {
  auto info = app_info_t{};
  info.logical_time = context_.clock().now();
  return info;
}

std::optional<delivery_record_t> query_service::load(
    delivery_id_t delivery_id) const {
  auto key = key::make_delivery_key(delivery_id);
  return context_.storage().get<delivery_record_t>(context_.encoder(),
                                                   make_bytes_view(key));
}

}  // namespace waybill::ledger
