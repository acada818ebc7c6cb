#pragma once

#include <waybill/schema/primitives.hpp>
#include <array>
#include <cstddef>
#include <mutex>

namespace waybill::ledger {

inline constexpr std::size_t kDeliveryLockStripes = 256;

/// Fixed set of exclusive mutexes; a delivery id always maps to the same one.
///
/// Every read-validate-write sequence on a delivery runs while holding the
/// lock returned by `acquire`, which gives each delivery a single total order
/// of mutations. Holders never take a second stripe.
class delivery_lock_table final {
 public:
  delivery_lock_table() = default;
  delivery_lock_table(const delivery_lock_table&) = delete;
  delivery_lock_table& operator=(const delivery_lock_table&) = delete;

  std::unique_lock<std::mutex> acquire(
      waybill::schema::delivery_id_t delivery_id);

  std::size_t stripe_of(waybill::schema::delivery_id_t delivery_id) const;
  std::size_t size() const { return stripes_.size(); }

 private:
  std::array<std::mutex, kDeliveryLockStripes> stripes_;
};

}  // namespace waybill::ledger
