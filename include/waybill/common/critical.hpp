#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace waybill::common {

/// Log, flush, and terminate. Reserved for failures that leave the ledger
/// store in an unknown state (open/read/write/decode errors).
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace waybill::common
