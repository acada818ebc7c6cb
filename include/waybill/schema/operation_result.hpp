#pragma once

#include <waybill/schema/ledger_error_code.hpp>
#include <waybill/schema/primitives.hpp>
#include <string>

// Schema type: operation result.
// Outcome of a mutating ledger call: code, human-readable log, and the
// codespace that produced it. `sequence` is set by log_event only.
namespace waybill::schema {

template <uint16_t Version>
struct operation_result;

template <>
struct operation_result<1> final {
  uint16_t version{1};
  ledger_error_code code{ledger_error_code::ok};
  std::string log;
  std::string codespace;
  sequence_t sequence{};

  bool ok() const { return code == ledger_error_code::ok; }
};

using operation_result_t = operation_result<1>;

}  // namespace waybill::schema
