#include <gtest/gtest.h>
#include <waybill/rpc/server.hpp>
#include <waybill/testing/ledger_fixture.hpp>

#include <string>

using namespace waybill::schema;

namespace {

waybill::v1::InitializeDeliveryRequest make_initialize_request(
    const uint64_t delivery_id,
    const std::string& fingerprint) {
  auto request = waybill::v1::InitializeDeliveryRequest{};
  request.set_caller("creator-1");
  request.set_delivery_id(delivery_id);
  request.set_operator_id("operator-1");
  request.set_supplier_id("supplier-1");
  request.set_recipient_id("recipient-1");
  request.set_expected_arrival(2000);
  request.set_payload_fingerprint(fingerprint);
  return request;
}

waybill::v1::LogEventRequest make_log_event_request(
    const std::string& caller,
    const uint64_t delivery_id,
    const std::string& status) {
  auto request = waybill::v1::LogEventRequest{};
  request.set_caller(caller);
  request.set_delivery_id(delivery_id);
  request.set_latitude("40.7");
  request.set_longitude("-74.0");
  request.set_altitude(100);
  request.set_status(status);
  request.set_note("note");
  return request;
}

std::string fingerprint_bytes() {
  auto hash = waybill::testing::make_hash(7);
  return make_string(bytes_view_t{hash});
}

}  // namespace

TEST(rpc_server, initialize_and_log_events_through_listener) {
  auto fixture = waybill::testing::ledger_fixture{"waybill_rpc_lifecycle"};
  auto listener =
      waybill::rpc::listener{fixture.context(), fixture.roles(),
                             fixture.ledger(), fixture.queries()};

  {
    auto request = make_initialize_request(1, fingerprint_bytes());
    auto response = waybill::v1::OperationResponse{};
    auto context = grpc::CallbackServerContext{};
    auto* reactor = listener.InitializeDelivery(&context, &request, &response);
    ASSERT_NE(reactor, nullptr);
    EXPECT_EQ(response.code(), 0u);
  }
  {
    auto request = make_log_event_request("operator-1", 1, "in-transit");
    auto response = waybill::v1::LogEventResponse{};
    auto context = grpc::CallbackServerContext{};
    auto* reactor = listener.LogEvent(&context, &request, &response);
    ASSERT_NE(reactor, nullptr);
    EXPECT_EQ(response.code(), 0u);
    EXPECT_EQ(response.sequence(), 1u);
  }
  {
    auto request = make_log_event_request("operator-1", 1, "teleported");
    auto response = waybill::v1::LogEventResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.LogEvent(&context, &request, &response);
    EXPECT_EQ(response.code(), 102u);
    EXPECT_EQ(response.codespace(), "waybill.ledger");
    EXPECT_FALSE(response.log().empty());
  }
  {
    auto request = waybill::v1::DeliveryRequest{};
    request.set_delivery_id(1);
    auto response = waybill::v1::GetDeliveryDetailsResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.GetDeliveryDetails(&context, &request, &response);
    EXPECT_EQ(response.code(), 0u);
    ASSERT_TRUE(response.found());
    EXPECT_EQ(response.delivery().status(), "in-transit");
    EXPECT_EQ(response.delivery().operator_id(), "operator-1");
    EXPECT_EQ(response.delivery().payload_fingerprint(), fingerprint_bytes());
    EXPECT_EQ(response.delivery().sequence(), 1u);
    EXPECT_FALSE(response.delivery().has_actual_arrival());
    EXPECT_FALSE(response.delivery().has_failure_reason());
  }
  {
    auto request = waybill::v1::GetEventLogRequest{};
    request.set_delivery_id(1);
    request.set_sequence(1);
    auto response = waybill::v1::GetEventLogResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.GetEventLog(&context, &request, &response);
    ASSERT_TRUE(response.found());
    EXPECT_EQ(response.entry().logical_time(), 1000u);
    EXPECT_EQ(response.entry().status(), "in-transit");
    EXPECT_EQ(response.entry().updater(), "operator-1");
    EXPECT_FALSE(response.entry().oracle_verified());
  }
}

TEST(rpc_server, fingerprint_must_be_32_bytes) {
  auto fixture = waybill::testing::ledger_fixture{"waybill_rpc_fingerprint"};
  auto listener =
      waybill::rpc::listener{fixture.context(), fixture.roles(),
                             fixture.ledger(), fixture.queries()};

  auto request = make_initialize_request(1, std::string(31, 'x'));
  auto response = waybill::v1::OperationResponse{};
  auto context = grpc::CallbackServerContext{};
  listener.InitializeDelivery(&context, &request, &response);
  EXPECT_EQ(response.code(), 106u);
  EXPECT_EQ(response.codespace(), "waybill.rpc");
  EXPECT_FALSE(fixture.queries().get_delivery_details(1).value.has_value());
}

TEST(rpc_server, role_numbers_outside_range_are_rejected) {
  auto fixture = waybill::testing::ledger_fixture{"waybill_rpc_role"};
  ASSERT_TRUE(fixture.create_delivery(1).ok());
  auto listener =
      waybill::rpc::listener{fixture.context(), fixture.roles(),
                             fixture.ledger(), fixture.queries()};

  {
    auto request = waybill::v1::RoleMutationRequest{};
    request.set_caller("creator-1");
    request.set_user("bob");
    request.set_delivery_id(1);
    request.set_role(6);
    auto response = waybill::v1::OperationResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.AssignRole(&context, &request, &response);
    EXPECT_EQ(response.code(), 114u);
  }
  {
    auto request = waybill::v1::RoleMutationRequest{};
    request.set_caller("creator-1");
    request.set_user("bob");
    request.set_delivery_id(1);
    request.set_role(1);
    auto response = waybill::v1::OperationResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.AssignRole(&context, &request, &response);
    EXPECT_EQ(response.code(), 0u);
  }
  {
    auto request = waybill::v1::HasRoleRequest{};
    request.set_user("bob");
    request.set_delivery_id(1);
    request.set_role(0);
    auto response = waybill::v1::HasRoleResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.HasRole(&context, &request, &response);
    EXPECT_EQ(response.code(), 114u);
  }
  {
    auto request = waybill::v1::GetRolesRequest{};
    request.set_user("bob");
    request.set_delivery_id(1);
    auto response = waybill::v1::GetRolesResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.GetRoles(&context, &request, &response);
    ASSERT_EQ(response.roles_size(), 1);
    EXPECT_EQ(response.roles(0), 1u);
  }
}

TEST(rpc_server, admin_and_oracle_controls) {
  auto fixture = waybill::testing::ledger_fixture{"waybill_rpc_admin"};
  auto listener =
      waybill::rpc::listener{fixture.context(), fixture.roles(),
                             fixture.ledger(), fixture.queries()};

  {
    auto request = waybill::v1::OracleMutationRequest{};
    request.set_caller("owner");
    request.set_oracle("sensor-1");
    auto response = waybill::v1::OperationResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.AddOracle(&context, &request, &response);
    EXPECT_EQ(response.code(), 0u);
  }
  {
    auto request = waybill::v1::EmptyRequest{};
    auto response = waybill::v1::GetOraclesResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.GetOracles(&context, &request, &response);
    ASSERT_EQ(response.oracles_size(), 1);
    EXPECT_EQ(response.oracles(0), "sensor-1");
  }
  {
    auto request = waybill::v1::AdminRequest{};
    request.set_caller("intruder");
    auto response = waybill::v1::OperationResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.Pause(&context, &request, &response);
    EXPECT_EQ(response.code(), 100u);
  }
  {
    auto request = waybill::v1::AdminRequest{};
    request.set_caller("owner");
    auto response = waybill::v1::OperationResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.Pause(&context, &request, &response);
    EXPECT_EQ(response.code(), 0u);
  }
  {
    auto request = waybill::v1::EmptyRequest{};
    auto response = waybill::v1::GetContractPausedResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.GetContractPaused(&context, &request, &response);
    EXPECT_TRUE(response.paused());
  }
  {
    auto request = make_initialize_request(1, fingerprint_bytes());
    auto response = waybill::v1::OperationResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.InitializeDelivery(&context, &request, &response);
    EXPECT_EQ(response.code(), 108u);
  }
  {
    auto request = waybill::v1::EmptyRequest{};
    auto response = waybill::v1::GetContractOwnerResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.GetContractOwner(&context, &request, &response);
    EXPECT_EQ(response.owner(), "owner");
  }
}

TEST(rpc_server, read_queries_report_not_found_and_info) {
  auto fixture = waybill::testing::ledger_fixture{"waybill_rpc_queries"};
  auto listener =
      waybill::rpc::listener{fixture.context(), fixture.roles(),
                             fixture.ledger(), fixture.queries()};

  {
    auto request = waybill::v1::DeliveryRequest{};
    request.set_delivery_id(9);
    auto response = waybill::v1::GetLatestSequenceResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.GetLatestSequence(&context, &request, &response);
    EXPECT_EQ(response.code(), 101u);
    EXPECT_EQ(response.codespace(), "waybill.query");
  }
  {
    auto request = waybill::v1::DeliveryRequest{};
    request.set_delivery_id(9);
    auto response = waybill::v1::IsDeliveryCompletedResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.IsDeliveryCompleted(&context, &request, &response);
    EXPECT_EQ(response.code(), 101u);
  }
  {
    auto request = waybill::v1::DeliveryRequest{};
    request.set_delivery_id(9);
    auto response = waybill::v1::GetDeliveryDetailsResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.GetDeliveryDetails(&context, &request, &response);
    EXPECT_EQ(response.code(), 0u);
    EXPECT_FALSE(response.found());
  }

  ASSERT_TRUE(fixture.create_delivery(1).ok());
  ASSERT_TRUE(fixture.ledger()
                  .log_failure("operator-1", 1, "flooded road")
                  .ok());
  {
    auto request = waybill::v1::DeliveryRequest{};
    request.set_delivery_id(1);
    auto response = waybill::v1::GetFailureReasonResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.GetFailureReason(&context, &request, &response);
    EXPECT_EQ(response.code(), 0u);
    ASSERT_TRUE(response.has_reason());
    EXPECT_EQ(response.reason(), "flooded road");
  }
  {
    auto request = waybill::v1::EmptyRequest{};
    auto response = waybill::v1::InfoResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.Info(&context, &request, &response);
    EXPECT_EQ(response.data(), "waybill-ledger");
    EXPECT_EQ(response.logical_time(), 1000u);
  }
}
