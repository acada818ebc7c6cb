#include <waybill/rpc/server.hpp>
#include <waybill/schema/delivery_status.hpp>
#include <waybill/schema/role_id.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace waybill::rpc;
using namespace waybill::schema;

namespace {

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

operation_result_t make_rpc_error(ledger_error_code code, std::string log) {
  auto result = operation_result_t{};
  result.code = code;
  result.log = std::move(log);
  result.codespace = std::string{kRpcCodespace};
  return result;
}

template <typename Response>
void populate_result(ledger_error_code code,
                     const std::string& log,
                     const std::string& codespace,
                     Response* response) {
  response->set_code(static_cast<uint32_t>(code));
  response->set_log(log);
  response->set_codespace(codespace);
}

template <typename Response>
void populate_result(const operation_result_t& result, Response* response) {
  populate_result(result.code, result.log, result.codespace, response);
}

template <typename Response, typename T>
void populate_result(const query_result<T>& result, Response* response) {
  populate_result(result.code, result.log, result.codespace, response);
}

std::optional<role_id_t> try_decode_role(uint32_t value,
                                         operation_result_t& error) {
  auto role = try_make_role_id(value);
  if (!role) {
    error = make_rpc_error(ledger_error_code::invalid_role,
                           "role must be between 1 and 5");
  }
  return role;
}

void populate_delivery(const delivery_record_t& source,
                       waybill::v1::DeliveryRecord* destination) {
  destination->set_status(std::string{to_string(source.status)});
  destination->set_operator_id(source.operator_id);
  destination->set_supplier_id(source.supplier_id);
  destination->set_recipient_id(source.recipient_id);
  destination->set_start_time(source.start_time);
  destination->set_expected_arrival(source.expected_arrival);
  if (source.actual_arrival) {
    destination->set_actual_arrival(*source.actual_arrival);
  }
  destination->set_payload_fingerprint(
      make_string(bytes_view_t{source.payload_fingerprint}));
  destination->set_sequence(source.sequence);
  destination->set_completed(source.completed);
  if (source.failure_reason) {
    destination->set_failure_reason(*source.failure_reason);
  }
}

void populate_entry(const event_log_entry_t& source,
                    waybill::v1::EventLogEntry* destination) {
  destination->set_logical_time(source.logical_time);
  destination->set_latitude(source.latitude);
  destination->set_longitude(source.longitude);
  destination->set_altitude(source.altitude);
  destination->set_status(std::string{to_string(source.status)});
  destination->set_updater(source.updater);
  destination->set_note(source.note);
  destination->set_oracle_verified(source.oracle_verified);
}

}  // namespace

listener::listener(waybill::ledger::ledger_context& context,
                   waybill::ledger::role_registry& roles,
                   waybill::ledger::delivery_ledger& ledger,
                   waybill::ledger::query_service& queries)
    : context_{context}, roles_{roles}, ledger_{ledger}, queries_{queries} {}

grpc::ServerUnaryReactor* listener::InitializeDelivery(
    grpc::CallbackServerContext* context,
    const waybill::v1::InitializeDeliveryRequest* request,
    waybill::v1::OperationResponse* response) {
  auto fingerprint =
      try_make_hash32(make_bytes_view(request->payload_fingerprint()));
  if (!fingerprint) {
    populate_result(
        make_rpc_error(ledger_error_code::invalid_payload_fingerprint,
                       "payload fingerprint must be exactly 32 bytes"),
        response);
    return finish_ok(context);
  }
  auto result = ledger_.initialize_delivery(
      request->caller(), request->delivery_id(), request->operator_id(),
      request->supplier_id(), request->recipient_id(),
      request->expected_arrival(), *fingerprint);
  populate_result(result, response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::LogEvent(
    grpc::CallbackServerContext* context,
    const waybill::v1::LogEventRequest* request,
    waybill::v1::LogEventResponse* response) {
  auto result = ledger_.log_event(
      request->caller(), request->delivery_id(), request->latitude(),
      request->longitude(), request->altitude(), request->status(),
      request->note());
  populate_result(result, response);
  response->set_sequence(result.sequence);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::LogFailure(
    grpc::CallbackServerContext* context,
    const waybill::v1::LogFailureRequest* request,
    waybill::v1::OperationResponse* response) {
  populate_result(ledger_.log_failure(request->caller(), request->delivery_id(),
                                      request->reason()),
                  response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::AssignRole(
    grpc::CallbackServerContext* context,
    const waybill::v1::RoleMutationRequest* request,
    waybill::v1::OperationResponse* response) {
  auto error = operation_result_t{};
  auto role = try_decode_role(request->role(), error);
  if (!role) {
    populate_result(error, response);
    return finish_ok(context);
  }
  populate_result(roles_.assign_role(request->caller(), request->user(),
                                     request->delivery_id(), *role),
                  response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::RemoveRole(
    grpc::CallbackServerContext* context,
    const waybill::v1::RoleMutationRequest* request,
    waybill::v1::OperationResponse* response) {
  auto error = operation_result_t{};
  auto role = try_decode_role(request->role(), error);
  if (!role) {
    populate_result(error, response);
    return finish_ok(context);
  }
  populate_result(roles_.remove_role(request->caller(), request->user(),
                                     request->delivery_id(), *role),
                  response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::AddOracle(
    grpc::CallbackServerContext* context,
    const waybill::v1::OracleMutationRequest* request,
    waybill::v1::OperationResponse* response) {
  populate_result(
      context_.oracles().add_oracle(request->caller(), request->oracle()),
      response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::RemoveOracle(
    grpc::CallbackServerContext* context,
    const waybill::v1::OracleMutationRequest* request,
    waybill::v1::OperationResponse* response) {
  populate_result(
      context_.oracles().remove_oracle(request->caller(), request->oracle()),
      response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Pause(
    grpc::CallbackServerContext* context,
    const waybill::v1::AdminRequest* request,
    waybill::v1::OperationResponse* response) {
  populate_result(context_.admin().pause(request->caller()), response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Unpause(
    grpc::CallbackServerContext* context,
    const waybill::v1::AdminRequest* request,
    waybill::v1::OperationResponse* response) {
  populate_result(context_.admin().unpause(request->caller()), response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetDeliveryDetails(
    grpc::CallbackServerContext* context,
    const waybill::v1::DeliveryRequest* request,
    waybill::v1::GetDeliveryDetailsResponse* response) {
  auto result = queries_.get_delivery_details(request->delivery_id());
  populate_result(result, response);
  response->set_found(result.value.has_value());
  if (result.value) {
    populate_delivery(*result.value, response->mutable_delivery());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetEventLog(
    grpc::CallbackServerContext* context,
    const waybill::v1::GetEventLogRequest* request,
    waybill::v1::GetEventLogResponse* response) {
  auto result =
      queries_.get_event_log(request->delivery_id(), request->sequence());
  populate_result(result, response);
  response->set_found(result.value.has_value());
  if (result.value) {
    populate_entry(*result.value, response->mutable_entry());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetLatestSequence(
    grpc::CallbackServerContext* context,
    const waybill::v1::DeliveryRequest* request,
    waybill::v1::GetLatestSequenceResponse* response) {
  auto result = queries_.get_latest_sequence(request->delivery_id());
  populate_result(result, response);
  response->set_sequence(result.value.value_or(0));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::IsDeliveryCompleted(
    grpc::CallbackServerContext* context,
    const waybill::v1::DeliveryRequest* request,
    waybill::v1::IsDeliveryCompletedResponse* response) {
  auto result = queries_.is_delivery_completed(request->delivery_id());
  populate_result(result, response);
  response->set_completed(result.value.value_or(false));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetFailureReason(
    grpc::CallbackServerContext* context,
    const waybill::v1::DeliveryRequest* request,
    waybill::v1::GetFailureReasonResponse* response) {
  auto result = queries_.get_failure_reason(request->delivery_id());
  populate_result(result, response);
  if (result.value) {
    response->set_reason(*result.value);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetOracles(
    grpc::CallbackServerContext* context,
    const waybill::v1::EmptyRequest* /*request*/,
    waybill::v1::GetOraclesResponse* response) {
  auto result = queries_.get_oracles();
  populate_result(result, response);
  for (const auto& oracle : result.value.value_or(std::vector<identity_t>{})) {
    response->add_oracles(oracle);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetContractPaused(
    grpc::CallbackServerContext* context,
    const waybill::v1::EmptyRequest* /*request*/,
    waybill::v1::GetContractPausedResponse* response) {
  auto result = queries_.get_contract_paused();
  populate_result(result, response);
  response->set_paused(result.value.value_or(false));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetContractOwner(
    grpc::CallbackServerContext* context,
    const waybill::v1::EmptyRequest* /*request*/,
    waybill::v1::GetContractOwnerResponse* response) {
  auto result = queries_.get_contract_owner();
  populate_result(result, response);
  response->set_owner(result.value.value_or(identity_t{}));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::HasRole(
    grpc::CallbackServerContext* context,
    const waybill::v1::HasRoleRequest* request,
    waybill::v1::HasRoleResponse* response) {
  auto error = operation_result_t{};
  auto role = try_decode_role(request->role(), error);
  if (!role) {
    populate_result(error, response);
    return finish_ok(context);
  }
  auto result =
      queries_.has_role(request->user(), request->delivery_id(), *role);
  populate_result(result, response);
  response->set_has_role(result.value.value_or(false));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetRoles(
    grpc::CallbackServerContext* context,
    const waybill::v1::GetRolesRequest* request,
    waybill::v1::GetRolesResponse* response) {
  auto result = queries_.get_roles(request->user(), request->delivery_id());
  populate_result(result, response);
  for (auto role : result.value.value_or(std::vector<role_id_t>{})) {
    response->add_roles(static_cast<uint32_t>(role));
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Info(
    grpc::CallbackServerContext* context,
    const waybill::v1::EmptyRequest* /*request*/,
    waybill::v1::InfoResponse* response) {
  auto info = queries_.info();
  response->set_data(info.data);
  response->set_version(info.version);
  response->set_app_version(info.app_version);
  response->set_logical_time(info.logical_time);
  return finish_ok(context);
}
