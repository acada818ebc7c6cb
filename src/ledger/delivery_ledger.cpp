#include <spdlog/spdlog.h>
#include <waybill/ledger/delivery_ledger.hpp>
#include <waybill/ledger/result.hpp>
#include <waybill/schema/delivery_status.hpp>
#include <waybill/schema/event_log_entry.hpp>
#include <waybill/schema/key/ledger_keys.hpp>
#include <waybill/schema/limits.hpp>
#include <array>
#include <utility>
#include <vector>

using namespace waybill::schema;

namespace {

waybill::schema::operation_result_t reject(
    std::string_view operation,
    waybill::schema::delivery_id_t delivery_id,
    waybill::schema::ledger_error_code code,
    std::string log) {
  spdlog::info("Rejected {} on delivery {}: {} ({})", operation, delivery_id,
               to_string(code), log);
  return waybill::ledger::make_operation_error(code, std::move(log));
}

}  // namespace

namespace waybill::ledger {

delivery_ledger::delivery_ledger(ledger_context& context, role_registry& roles)
    : context_{context}, roles_{roles} {}

operation_result_t delivery_ledger::initialize_delivery(
    const identity_t& caller,
    delivery_id_t delivery_id,
    const identity_t& operator_id,
    const identity_t& supplier_id,
    const identity_t& recipient_id,
    logical_time_t expected_arrival,
    const payload_fingerprint_t& payload_fingerprint) {
  auto lock = context_.locks().acquire(delivery_id);
  auto delivery_key = key::make_delivery_key(delivery_id);
  if (context_.storage().contains(make_bytes_view(delivery_key))) {
    return reject("initialize_delivery", delivery_id,
                  ledger_error_code::already_initialized,
                  "delivery already exists");
  }
  if (context_.admin().is_paused()) {
    return reject("initialize_delivery", delivery_id, ledger_error_code::paused,
                  "ledger is paused");
  }

  auto identities = std::array<std::pair<std::string_view, std::string_view>, 4>{
      {{"caller", caller},
       {"operator", operator_id},
       {"supplier", supplier_id},
       {"recipient", recipient_id}}};
  for (const auto& [field, value] : identities) {
    if (auto error = check_length(field, value, kMaxIdentityLength)) {
      return *error;
    }
  }

  auto record = delivery_record_t{};
  record.status = delivery_status_t::pending;
  record.operator_id = operator_id;
  record.supplier_id = supplier_id;
  record.recipient_id = recipient_id;
  record.start_time = context_.clock().now();
  record.expected_arrival = expected_arrival;
  record.payload_fingerprint = payload_fingerprint;

  auto batch = roles_.make_initial_assignments(delivery_id, caller, operator_id,
                                               supplier_id, recipient_id);
  batch.emplace_back(std::move(delivery_key), context_.encoder().encode(record));
  context_.storage().write_batch(batch);

  spdlog::debug("Initialized delivery {} by '{}' (operator '{}')", delivery_id,
                caller, operator_id);
  return make_operation_ok();
}

operation_result_t delivery_ledger::log_event(const identity_t& caller,
                                              delivery_id_t delivery_id,
                                              std::string_view latitude,
                                              std::string_view longitude,
                                              altitude_t altitude,
                                              std::string_view status,
                                              std::string_view note) {
  auto lock = context_.locks().acquire(delivery_id);
  auto record = load(delivery_id);
  if (auto error = check_writable("log_event", delivery_id, record)) {
    return *error;
  }

  if (auto error = check_length("caller", caller, kMaxIdentityLength)) {
    return *error;
  }
  if (auto error = check_length("latitude", latitude, kMaxCoordinateLength)) {
    return *error;
  }
  if (auto error = check_length("longitude", longitude, kMaxCoordinateLength)) {
    return *error;
  }
  if (auto error = check_length("status", status, kMaxStatusLength)) {
    return *error;
  }
  if (auto error = check_length("note", note, kMaxNoteLength)) {
    return *error;
  }

  auto oracle_verified = context_.oracles().is_oracle(caller);
  if (!oracle_verified &&
      !roles_.has_role(caller, delivery_id, role_id_t::operator_)) {
    return reject("log_event", delivery_id, ledger_error_code::unauthorized,
                  "caller is neither operator nor oracle");
  }

  auto next_status = try_from_string<delivery_status_t>(status);
  if (!next_status) {
    return reject("log_event", delivery_id, ledger_error_code::invalid_status,
                  "unknown delivery status");
  }
  if (latitude.empty() || longitude.empty()) {
    return reject("log_event", delivery_id,
                  ledger_error_code::invalid_coordinates,
                  "latitude and longitude must be non-empty");
  }
  if (record->sequence >= kMaxEventsPerDelivery) {
    return reject("log_event", delivery_id,
                  ledger_error_code::log_limit_exceeded,
                  "event log is full");
  }

  auto sequence = record->sequence + 1;
  auto now = context_.clock().advance();

  auto entry = event_log_entry_t{};
  entry.logical_time = now;
  entry.latitude = std::string{latitude};
  entry.longitude = std::string{longitude};
  entry.altitude = altitude;
  entry.status = *next_status;
  entry.updater = caller;
  entry.note = std::string{note};
  entry.oracle_verified = oracle_verified;

  record->status = *next_status;
  record->sequence = sequence;
  if (is_terminal(*next_status)) {
    record->completed = true;
    record->actual_arrival = now;
  }

  auto& encoder = context_.encoder();
  context_.storage().write_batch(std::vector<waybill::storage::key_value_entry_t>{
      {key::make_event_log_key(delivery_id, sequence), encoder.encode(entry)},
      {key::make_delivery_key(delivery_id), encoder.encode(*record)}});

  spdlog::debug("Logged event {} on delivery {} by '{}' ({}{})", sequence,
                delivery_id, caller, to_string(*next_status),
                oracle_verified ? ", oracle verified" : "");
  auto result = make_operation_ok();
  result.sequence = sequence;
  return result;
}

operation_result_t delivery_ledger::log_failure(const identity_t& caller,
                                                delivery_id_t delivery_id,
                                                std::string_view reason) {
  auto lock = context_.locks().acquire(delivery_id);
  auto record = load(delivery_id);
  if (auto error = check_writable("log_failure", delivery_id, record)) {
    return *error;
  }
  if (auto error = check_length("caller", caller, kMaxIdentityLength)) {
    return *error;
  }
  if (auto error = check_length("reason", reason, kMaxFailureReasonLength)) {
    return *error;
  }
  if (!roles_.has_role(caller, delivery_id, role_id_t::operator_)) {
    return reject("log_failure", delivery_id, ledger_error_code::unauthorized,
                  "caller does not hold operator for delivery");
  }

  record->status = delivery_status_t::failed;
  record->completed = true;
  record->failure_reason = std::string{reason};
  context_.storage().put(context_.encoder(),
                         make_bytes_view(key::make_delivery_key(delivery_id)),
                         *record);

  spdlog::debug("Delivery {} marked failed by '{}'", delivery_id, caller);
  return make_operation_ok();
}

std::optional<delivery_record_t> delivery_ledger::load(
    delivery_id_t delivery_id) const {
  auto key = key::make_delivery_key(delivery_id);
  return context_.storage().get<delivery_record_t>(context_.encoder(),
                                                   make_bytes_view(key));
}

std::optional<operation_result_t> delivery_ledger::check_writable(
    std::string_view operation,
    delivery_id_t delivery_id,
    const std::optional<delivery_record_t>& record) const {
  if (!record) {
    return reject(operation, delivery_id, ledger_error_code::not_found,
                  "delivery does not exist");
  }
  if (context_.admin().is_paused()) {
    return reject(operation, delivery_id, ledger_error_code::paused,
                  "ledger is paused");
  }
  if (record->completed) {
    return reject(operation, delivery_id, ledger_error_code::already_completed,
                  "delivery is already completed");
  }
  return std::nullopt;
}

}  // namespace waybill::ledger
