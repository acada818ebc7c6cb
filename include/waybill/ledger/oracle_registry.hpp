#pragma once

#include <waybill/ledger/admin_control.hpp>
#include <waybill/ledger/backend.hpp>
#include <waybill/schema/operation_result.hpp>
#include <waybill/schema/oracle_registry_state.hpp>
#include <mutex>
#include <string_view>
#include <vector>

namespace waybill::ledger {

/// Global allowlist of trusted automated updaters. Owner-mutable only.
class oracle_registry final {
 public:
  oracle_registry(encoder_t& encoder,
                  storage_t& storage,
                  const admin_control& admin);

  oracle_registry(const oracle_registry&) = delete;
  oracle_registry& operator=(const oracle_registry&) = delete;

  /// Append `identity`; duplicates are kept. At most kMaxOracles entries.
  waybill::schema::operation_result_t add_oracle(
      const waybill::schema::identity_t& caller,
      const waybill::schema::identity_t& identity);

  /// Remove every occurrence of `identity`; absent identities are a no-op.
  waybill::schema::operation_result_t remove_oracle(
      const waybill::schema::identity_t& caller,
      const waybill::schema::identity_t& identity);

  bool is_oracle(std::string_view identity) const;

  /// Snapshot in insertion order.
  std::vector<waybill::schema::identity_t> oracles() const;

 private:
  void persist(const waybill::schema::oracle_registry_state_t& state);

  mutable std::mutex mutex_;
  encoder_t& encoder_;
  storage_t& storage_;
  const admin_control& admin_;
  waybill::schema::oracle_registry_state_t state_;
};

}  // namespace waybill::ledger
