#pragma once

#include <waybill/ledger/admin_control.hpp>
#include <waybill/ledger/backend.hpp>
#include <waybill/ledger/delivery_lock_table.hpp>
#include <waybill/ledger/logical_clock.hpp>
#include <waybill/ledger/oracle_registry.hpp>
#include <waybill/schema/primitives.hpp>

namespace waybill::ledger {

inline constexpr waybill::schema::logical_time_t kDefaultGenesisTime = 1000;

struct ledger_options final {
  /// Owner used only when the store does not yet have one.
  waybill::schema::identity_t owner;
  waybill::schema::logical_time_t genesis_time{kDefaultGenesisTime};
};

/// Process-wide ledger state created once at startup and shared by every
/// component: codec and storage handles, the admin and oracle state, the
/// logical clock and the per-delivery lock table.
class ledger_context final {
 public:
  /// Load persisted admin and oracle state and resume the logical clock at
  /// max(genesis, 1 + latest logged time).
  ledger_context(encoder_t& encoder,
                 storage_t& storage,
                 const ledger_options& options);

  ledger_context(const ledger_context&) = delete;
  ledger_context& operator=(const ledger_context&) = delete;

  encoder_t& encoder() { return encoder_; }
  const storage_t& storage() const { return storage_; }
  logical_clock& clock() { return clock_; }
  const logical_clock& clock() const { return clock_; }
  delivery_lock_table& locks() { return locks_; }
  admin_control& admin() { return admin_; }
  const admin_control& admin() const { return admin_; }
  oracle_registry& oracles() { return oracles_; }
  const oracle_registry& oracles() const { return oracles_; }

 private:
  encoder_t& encoder_;
  storage_t& storage_;
  admin_control admin_;
  oracle_registry oracles_;
  logical_clock clock_;
  delivery_lock_table locks_;
};

}  // namespace waybill::ledger
