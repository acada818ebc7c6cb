#pragma once

#include <waybill/ledger/delivery_ledger.hpp>
#include <waybill/ledger/ledger_context.hpp>
#include <waybill/ledger/query_service.hpp>
#include <waybill/ledger/role_registry.hpp>
#include <waybill/testing/common.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace waybill::testing {

inline constexpr std::string_view kOwner{"owner"};
inline constexpr std::string_view kOperator{"operator-1"};
inline constexpr std::string_view kSupplier{"supplier-1"};
inline constexpr std::string_view kRecipient{"recipient-1"};
inline constexpr std::string_view kCreator{"creator-1"};

/// Ledger components over a private RocksDB directory. `reopen` drops every
/// component and the store, then opens the same directory again.
class ledger_fixture final {
 public:
  explicit ledger_fixture(
      const std::string_view db_prefix,
      waybill::ledger::ledger_options options =
          waybill::ledger::ledger_options{.owner = std::string{kOwner}})
      : db_path_{make_db_path(db_prefix)}, options_{std::move(options)} {
    open();
  }

  ledger_fixture(const ledger_fixture&) = delete;
  ledger_fixture& operator=(const ledger_fixture&) = delete;
  ledger_fixture(ledger_fixture&&) = delete;
  ledger_fixture& operator=(ledger_fixture&&) = delete;

  ~ledger_fixture() {
    close();
    remove_path(db_path_);
  }

  void reopen(waybill::ledger::ledger_options options) {
    close();
    options_ = std::move(options);
    open();
  }

  void reopen() { reopen(options_); }

  const std::string& db_path() const { return db_path_; }
  waybill::ledger::encoder_t& encoder() { return encoder_; }
  waybill::ledger::storage_t& storage() { return *storage_; }
  waybill::ledger::ledger_context& context() { return *context_; }
  waybill::ledger::role_registry& roles() { return *roles_; }
  waybill::ledger::delivery_ledger& ledger() { return *ledger_; }
  waybill::ledger::query_service& queries() { return *queries_; }

  /// Create delivery `id` with the default operator, supplier and recipient.
  waybill::schema::operation_result_t create_delivery(
      const waybill::schema::delivery_id_t id,
      const std::string_view creator = kCreator) {
    return ledger_->initialize_delivery(
        std::string{creator}, id, std::string{kOperator},
        std::string{kSupplier}, std::string{kRecipient}, 2000, make_hash(7));
  }

  waybill::schema::operation_result_t log_status(
      const waybill::schema::delivery_id_t id,
      const std::string_view status,
      const std::string_view caller = kOperator) {
    return ledger_->log_event(std::string{caller}, id, "40.7", "-74.0", 100,
                              status, "note");
  }

 private:
  void open() {
    storage_ = std::make_unique<waybill::ledger::storage_t>(
        waybill::storage::make_storage<waybill::storage::rocksdb_storage_tag>(
            db_path_));
    context_ = std::make_unique<waybill::ledger::ledger_context>(
        encoder_, *storage_, options_);
    roles_ = std::make_unique<waybill::ledger::role_registry>(*context_);
    ledger_ =
        std::make_unique<waybill::ledger::delivery_ledger>(*context_, *roles_);
    queries_ =
        std::make_unique<waybill::ledger::query_service>(*context_, *roles_);
  }

  void close() {
    queries_.reset();
    ledger_.reset();
    roles_.reset();
    context_.reset();
    storage_.reset();
  }

  std::string db_path_;
  waybill::ledger::ledger_options options_;
  waybill::ledger::encoder_t encoder_{};
  std::unique_ptr<waybill::ledger::storage_t> storage_;
  std::unique_ptr<waybill::ledger::ledger_context> context_;
  std::unique_ptr<waybill::ledger::role_registry> roles_;
  std::unique_ptr<waybill::ledger::delivery_ledger> ledger_;
  std::unique_ptr<waybill::ledger::query_service> queries_;
};

}  // namespace waybill::testing
