#include <spdlog/spdlog.h>
#include <waybill/ledger/oracle_registry.hpp>
#include <waybill/ledger/result.hpp>
#include <waybill/schema/key/ledger_keys.hpp>
#include <waybill/schema/limits.hpp>
#include <algorithm>

using namespace waybill::schema;

namespace waybill::ledger {

oracle_registry::oracle_registry(encoder_t& encoder,
                                 storage_t& storage,
                                 const admin_control& admin)
    : encoder_{encoder}, storage_{storage}, admin_{admin} {
  auto key = key::make_oracle_registry_key();
  auto persisted =
      storage_.get<oracle_registry_state_t>(encoder_, make_bytes_view(key));
  if (persisted) {
    state_ = std::move(*persisted);
  }
  spdlog::info("Loaded {} oracle(s)", state_.oracles.size());
}

operation_result_t oracle_registry::add_oracle(const identity_t& caller,
                                               const identity_t& identity) {
  if (auto error = check_length("caller", caller, kMaxIdentityLength)) {
    return *error;
  }
  if (auto error = check_length("oracle", identity, kMaxIdentityLength)) {
    return *error;
  }
  if (!admin_.is_owner(caller)) {
    spdlog::info("Rejected add_oracle from '{}': {}", caller,
                 to_string(ledger_error_code::unauthorized));
    return make_operation_error(ledger_error_code::unauthorized,
                                "caller is not the contract owner");
  }

  auto lock = std::scoped_lock{mutex_};
  if (state_.oracles.size() >= kMaxOracles) {
    spdlog::info("Rejected add_oracle '{}': {}", identity,
                 to_string(ledger_error_code::oracle_capacity_exceeded));
    return make_operation_error(ledger_error_code::oracle_capacity_exceeded,
                                "oracle registry is full");
  }

  auto next = state_;
  next.oracles.push_back(identity);
  persist(next);
  state_ = std::move(next);
  spdlog::debug("Added oracle '{}'", identity);
  return make_operation_ok();
}

operation_result_t oracle_registry::remove_oracle(const identity_t& caller,
                                                  const identity_t& identity) {
  if (auto error = check_length("caller", caller, kMaxIdentityLength)) {
    return *error;
  }
  if (auto error = check_length("oracle", identity, kMaxIdentityLength)) {
    return *error;
  }
  if (!admin_.is_owner(caller)) {
    spdlog::info("Rejected remove_oracle from '{}': {}", caller,
                 to_string(ledger_error_code::unauthorized));
    return make_operation_error(ledger_error_code::unauthorized,
                                "caller is not the contract owner");
  }

  auto lock = std::scoped_lock{mutex_};
  auto next = state_;
  auto removed = std::erase(next.oracles, identity);
  if (removed == 0) {
    return make_operation_ok();
  }
  persist(next);
  state_ = std::move(next);
  spdlog::debug("Removed oracle '{}' ({} occurrence(s))", identity, removed);
  return make_operation_ok();
}

bool oracle_registry::is_oracle(std::string_view identity) const {
  auto lock = std::scoped_lock{mutex_};
  return std::ranges::find(state_.oracles, identity) !=
         std::end(state_.oracles);
}

std::vector<identity_t> oracle_registry::oracles() const {
  auto lock = std::scoped_lock{mutex_};
  return state_.oracles;
}

void oracle_registry::persist(const oracle_registry_state_t& state) {
  storage_.put(encoder_, make_bytes_view(key::make_oracle_registry_key()),
               state);
}

}  // namespace waybill::ledger
