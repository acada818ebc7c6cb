#include <spdlog/spdlog.h>
#include <waybill/common/critical.hpp>
#include <waybill/ledger/admin_control.hpp>
#include <waybill/ledger/result.hpp>
#include <waybill/schema/key/ledger_keys.hpp>
#include <waybill/schema/limits.hpp>

using namespace waybill::schema;

namespace waybill::ledger {

admin_control::admin_control(encoder_t& encoder,
                             storage_t& storage,
                             std::string_view configured_owner)
    : encoder_{encoder}, storage_{storage} {
  auto key = key::make_admin_state_key();
  auto persisted =
      storage_.get<admin_state_t>(encoder_, make_bytes_view(key));
  if (persisted) {
    state_ = std::move(*persisted);
    if (!configured_owner.empty() && configured_owner != state_.owner) {
      spdlog::warn(
          "Configured owner '{}' differs from persisted owner '{}'; keeping "
          "persisted owner",
          configured_owner, state_.owner);
    }
    spdlog::info("Loaded admin state: owner '{}', paused {}", state_.owner,
                 state_.paused);
    return;
  }

  if (configured_owner.empty()) {
    waybill::common::critical(
        "no persisted owner found and no owner configured");
  }
  if (configured_owner.size() > kMaxIdentityLength) {
    waybill::common::critical("configured owner identity is too long");
  }
  state_.owner = std::string{configured_owner};
  state_.paused = false;
  storage_.put(encoder_, make_bytes_view(key), state_);
  spdlog::info("Initialized admin state with owner '{}'", state_.owner);
}

operation_result_t admin_control::pause(const identity_t& caller) {
  return set_paused(caller, true);
}

operation_result_t admin_control::unpause(const identity_t& caller) {
  return set_paused(caller, false);
}

bool admin_control::is_paused() const {
  auto lock = std::scoped_lock{mutex_};
  return state_.paused;
}

bool admin_control::is_owner(std::string_view identity) const {
  auto lock = std::scoped_lock{mutex_};
  return state_.owner == identity;
}

identity_t admin_control::owner() const {
  auto lock = std::scoped_lock{mutex_};
  return state_.owner;
}

operation_result_t admin_control::set_paused(const identity_t& caller,
                                             bool paused) {
  if (auto error = check_length("caller", caller, kMaxIdentityLength)) {
    return *error;
  }

  auto lock = std::scoped_lock{mutex_};
  if (caller != state_.owner) {
    spdlog::info("Rejected {} from '{}': {}", paused ? "pause" : "unpause",
                 caller, to_string(ledger_error_code::unauthorized));
    return make_operation_error(ledger_error_code::unauthorized,
                                "caller is not the contract owner");
  }

  auto next = state_;
  next.paused = paused;
  storage_.put(encoder_, make_bytes_view(key::make_admin_state_key()), next);
  state_ = std::move(next);
  spdlog::debug("Ledger {} by '{}'", paused ? "paused" : "unpaused", caller);
  return make_operation_ok();
}

}  // namespace waybill::ledger
