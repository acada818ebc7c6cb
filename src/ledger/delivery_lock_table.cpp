#include <waybill/ledger/delivery_lock_table.hpp>

namespace waybill::ledger {

std::unique_lock<std::mutex> delivery_lock_table::acquire(
    waybill::schema::delivery_id_t delivery_id) {
  return std::unique_lock<std::mutex>{stripes_[stripe_of(delivery_id)]};
}

std::size_t delivery_lock_table::stripe_of(
    waybill::schema::delivery_id_t delivery_id) const {
  return static_cast<std::size_t>(delivery_id % kDeliveryLockStripes);
}

}  // namespace waybill::ledger
