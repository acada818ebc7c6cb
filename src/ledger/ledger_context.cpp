#include <spdlog/spdlog.h>
#include <waybill/ledger/ledger_context.hpp>
#include <waybill/schema/event_log_entry.hpp>
#include <waybill/schema/key/ledger_keys.hpp>
#include <algorithm>

using namespace waybill::schema;

namespace {

logical_time_t recover_clock(waybill::ledger::encoder_t& encoder,
                             const waybill::ledger::storage_t& storage,
                             logical_time_t genesis_time) {
  auto next = genesis_time;
  auto entries = storage.list_by_prefix(
      make_bytes_view(waybill::schema::key::kEventLogKeyPrefix));
  for (const auto& [key, value] : entries) {
    auto entry = encoder.try_decode<event_log_entry_t>(make_bytes_view(value));
    if (!entry) {
      spdlog::warn("Skipping undecodable event log row while resuming clock");
      continue;
    }
    next = std::max(next, entry->logical_time + 1);
  }
  spdlog::info("Logical clock resumes at {} ({} logged event(s))", next,
               entries.size());
  return next;
}

}  // namespace

namespace waybill::ledger {

ledger_context::ledger_context(encoder_t& encoder,
                               storage_t& storage,
                               const ledger_options& options)
    : encoder_{encoder},
      storage_{storage},
      admin_{encoder, storage, options.owner},
      oracles_{encoder, storage, admin_},
      clock_{recover_clock(encoder, storage, options.genesis_time)} {}

}  // namespace waybill::ledger
