#pragma once

#include <waybill/schema/primitives.hpp>
#include <atomic>

namespace waybill::ledger {

/// Monotonic logical time source. Only successful event appends advance it.
class logical_clock final {
 public:
  explicit logical_clock(waybill::schema::logical_time_t start);

  logical_clock(const logical_clock&) = delete;
  logical_clock& operator=(const logical_clock&) = delete;

  /// Current logical time.
  waybill::schema::logical_time_t now() const;

  /// Return the current logical time and move the clock one tick forward.
  waybill::schema::logical_time_t advance();

 private:
  std::atomic<waybill::schema::logical_time_t> value_;
};

}  // namespace waybill::ledger
