#include <waybill/ledger/logical_clock.hpp>

namespace waybill::ledger {

logical_clock::logical_clock(waybill::schema::logical_time_t start)
    : value_{start} {}

waybill::schema::logical_time_t logical_clock::now() const {
  return value_.load(std::memory_order_acquire);
}

waybill::schema::logical_time_t logical_clock::advance() {
  return value_.fetch_add(1, std::memory_order_acq_rel);
}

}  // namespace waybill::ledger
