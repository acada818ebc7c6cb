#include <gtest/gtest.h>
#include <waybill/schema/encoding/scale/encoder.hpp>
#include <waybill/testing/common.hpp>

#include <string>

using namespace waybill::schema;

namespace {

using encoder_t =
    waybill::schema::encoding::encoder<waybill::schema::encoding::scale_encoder_tag>;

}  // namespace

TEST(encoding_types, delivery_record_keeps_optional_fields) {
  auto encoder = encoder_t{};
  auto record = delivery_record_t{};
  record.status = delivery_status_t::failed;
  record.operator_id = "op";
  record.supplier_id = "sup";
  record.recipient_id = "rec";
  record.start_time = 1000;
  record.expected_arrival = 2000;
  record.actual_arrival = 1005;
  record.payload_fingerprint = waybill::testing::make_hash(3);
  record.sequence = 4;
  record.completed = true;
  record.failure_reason = std::string{"truck broke down"};

  auto encoded = encoder.encode(record);
  auto decoded = encoder.decode<delivery_record_t>(
      bytes_view_t{encoded.data(), encoded.size()});
  EXPECT_EQ(decoded.status, delivery_status_t::failed);
  EXPECT_EQ(decoded.operator_id, "op");
  EXPECT_EQ(decoded.recipient_id, "rec");
  EXPECT_EQ(decoded.actual_arrival, std::optional<logical_time_t>{1005});
  EXPECT_EQ(decoded.payload_fingerprint, record.payload_fingerprint);
  EXPECT_EQ(decoded.sequence, 4u);
  EXPECT_TRUE(decoded.completed);
  EXPECT_EQ(decoded.failure_reason, record.failure_reason);
}

TEST(encoding_types, empty_optionals_stay_empty) {
  auto encoder = encoder_t{};
  auto record = delivery_record_t{};
  record.operator_id = "op";
  auto encoded = encoder.encode(record);
  auto decoded = encoder.decode<delivery_record_t>(
      bytes_view_t{encoded.data(), encoded.size()});
  EXPECT_FALSE(decoded.actual_arrival.has_value());
  EXPECT_FALSE(decoded.failure_reason.has_value());
  EXPECT_EQ(decoded.status, delivery_status_t::pending);
}

TEST(encoding_types, role_assignment_keeps_duplicates_in_order) {
  auto encoder = encoder_t{};
  auto assignment = role_assignment_t{.user = "alice", .delivery_id = 9};
  assignment.roles[0] = role_id_t::operator_;
  assignment.roles[1] = role_id_t::operator_;
  assignment.roles[2] = role_id_t::recipient;
  assignment.count = 3;

  auto encoded = encoder.encode(assignment);
  auto decoded = encoder.decode<role_assignment_t>(
      bytes_view_t{encoded.data(), encoded.size()});
  EXPECT_EQ(decoded.user, "alice");
  EXPECT_EQ(decoded.delivery_id, 9u);
  ASSERT_EQ(decoded.count, 3u);
  EXPECT_EQ(decoded.roles[0], role_id_t::operator_);
  EXPECT_EQ(decoded.roles[1], role_id_t::operator_);
  EXPECT_EQ(decoded.roles[2], role_id_t::recipient);
}

TEST(encoding_types, event_log_entry_and_registry_state_decode) {
  auto encoder = encoder_t{};
  auto entry = event_log_entry_t{};
  entry.logical_time = 1001;
  entry.latitude = "40.7";
  entry.longitude = "-74.0";
  entry.altitude = 100;
  entry.status = delivery_status_t::in_transit;
  entry.updater = "oracle-1";
  entry.note = "started";
  entry.oracle_verified = true;
  auto encoded_entry = encoder.encode(entry);
  auto decoded_entry = encoder.decode<event_log_entry_t>(
      bytes_view_t{encoded_entry.data(), encoded_entry.size()});
  EXPECT_EQ(decoded_entry.logical_time, 1001u);
  EXPECT_EQ(decoded_entry.longitude, "-74.0");
  EXPECT_EQ(decoded_entry.status, delivery_status_t::in_transit);
  EXPECT_TRUE(decoded_entry.oracle_verified);

  auto registry = oracle_registry_state_t{.oracles = {"a", "b", "a"}};
  auto encoded_registry = encoder.encode(registry);
  auto decoded_registry = encoder.decode<oracle_registry_state_t>(
      bytes_view_t{encoded_registry.data(), encoded_registry.size()});
  EXPECT_EQ(decoded_registry.oracles, registry.oracles);

  auto admin = admin_state_t{.owner = "owner", .paused = true};
  auto encoded_admin = encoder.encode(admin);
  auto decoded_admin = encoder.decode<admin_state_t>(
      bytes_view_t{encoded_admin.data(), encoded_admin.size()});
  EXPECT_EQ(decoded_admin.owner, "owner");
  EXPECT_TRUE(decoded_admin.paused);
}

TEST(encoding_types, try_decode_rejects_truncated_bytes) {
  auto encoder = encoder_t{};
  auto record = delivery_record_t{};
  record.operator_id = "operator";
  auto encoded = encoder.encode(record);
  encoded.resize(encoded.size() / 2);
  auto decoded = encoder.try_decode<delivery_record_t>(
      bytes_view_t{encoded.data(), encoded.size()});
  EXPECT_FALSE(decoded.has_value());
}
