#pragma once

#include <waybill/ledger/backend.hpp>
#include <waybill/schema/admin_state.hpp>
#include <waybill/schema/operation_result.hpp>
#include <mutex>
#include <string_view>

namespace waybill::ledger {

/// Global owner identity and pause flag.
///
/// The owner is fixed the first time a data directory is opened; later opens
/// keep the persisted owner. Pausing gates delivery mutations only.
class admin_control final {
 public:
  /// Load persisted admin state, or seed it from `configured_owner` when the
  /// store has none. Terminates when neither is available.
  admin_control(encoder_t& encoder,
                storage_t& storage,
                std::string_view configured_owner);

  admin_control(const admin_control&) = delete;
  admin_control& operator=(const admin_control&) = delete;

  waybill::schema::operation_result_t pause(
      const waybill::schema::identity_t& caller);
  waybill::schema::operation_result_t unpause(
      const waybill::schema::identity_t& caller);

  bool is_paused() const;
  bool is_owner(std::string_view identity) const;
  waybill::schema::identity_t owner() const;

 private:
  waybill::schema::operation_result_t set_paused(
      const waybill::schema::identity_t& caller,
      bool paused);

  mutable std::mutex mutex_;
  encoder_t& encoder_;
  storage_t& storage_;
  waybill::schema::admin_state_t state_;
};

}  // namespace waybill::ledger
