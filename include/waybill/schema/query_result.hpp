#pragma once

#include <waybill/schema/ledger_error_code.hpp>
#include <optional>
#include <string>

// Schema type: query result.
// Read API envelope. A successful lookup of an absent row has code ok and an
// empty value; only lookups that require the delivery to exist report
// not_found.
namespace waybill::schema {

template <typename T>
struct query_result final {
  ledger_error_code code{ledger_error_code::ok};
  std::string log;
  std::string codespace;
  std::optional<T> value;

  bool ok() const { return code == ledger_error_code::ok; }
};

}  // namespace waybill::schema
