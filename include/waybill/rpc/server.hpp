#pragma once

#include <waybill/v1/delivery_ledger.grpc.pb.h>
#include <waybill/ledger/delivery_ledger.hpp>
#include <waybill/ledger/ledger_context.hpp>
#include <waybill/ledger/query_service.hpp>
#include <waybill/ledger/role_registry.hpp>
#include <string_view>

namespace waybill::rpc {

inline constexpr std::string_view kRpcCodespace{"waybill.rpc"};

/// Callback listener exposing the delivery ledger over gRPC.
///
/// Quick reference:
/// - InitializeDelivery/LogEvent/LogFailure: delivery lifecycle writes.
/// - AssignRole/RemoveRole: per-delivery capabilities, admin role only.
/// - AddOracle/RemoveOracle/Pause/Unpause: owner-only global controls.
/// - Get*/HasRole/Info: read-only projections.
///
/// Ledger outcomes are reported through the response code; the gRPC status
/// is always OK. Malformed fingerprints and role numbers are rejected here
/// before the ledger sees them.
struct listener final : public waybill::v1::DeliveryLedger::CallbackService {
  listener(waybill::ledger::ledger_context& context,
           waybill::ledger::role_registry& roles,
           waybill::ledger::delivery_ledger& ledger,
           waybill::ledger::query_service& queries);

  virtual grpc::ServerUnaryReactor* InitializeDelivery(
      grpc::CallbackServerContext* context,
      const waybill::v1::InitializeDeliveryRequest* request,
      waybill::v1::OperationResponse* response) override final;

  virtual grpc::ServerUnaryReactor* LogEvent(
      grpc::CallbackServerContext* context,
      const waybill::v1::LogEventRequest* request,
      waybill::v1::LogEventResponse* response) override final;

  virtual grpc::ServerUnaryReactor* LogFailure(
      grpc::CallbackServerContext* context,
      const waybill::v1::LogFailureRequest* request,
      waybill::v1::OperationResponse* response) override final;

  virtual grpc::ServerUnaryReactor* AssignRole(
      grpc::CallbackServerContext* context,
      const waybill::v1::RoleMutationRequest* request,
      waybill::v1::OperationResponse* response) override final;

  virtual grpc::ServerUnaryReactor* RemoveRole(
      grpc::CallbackServerContext* context,
      const waybill::v1::RoleMutationRequest* request,
      waybill::v1::OperationResponse* response) override final;

  virtual grpc::ServerUnaryReactor* AddOracle(
      grpc::CallbackServerContext* context,
      const waybill::v1::OracleMutationRequest* request,
      waybill::v1::OperationResponse* response) override final;

  virtual grpc::ServerUnaryReactor* RemoveOracle(
      grpc::CallbackServerContext* context,
      const waybill::v1::OracleMutationRequest* request,
      waybill::v1::OperationResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Pause(
      grpc::CallbackServerContext* context,
      const waybill::v1::AdminRequest* request,
      waybill::v1::OperationResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Unpause(
      grpc::CallbackServerContext* context,
      const waybill::v1::AdminRequest* request,
      waybill::v1::OperationResponse* response) override final;

  /// `found` is false when the delivery does not exist.
  virtual grpc::ServerUnaryReactor* GetDeliveryDetails(
      grpc::CallbackServerContext* context,
      const waybill::v1::DeliveryRequest* request,
      waybill::v1::GetDeliveryDetailsResponse* response) override final;

  /// `found` is false when no entry exists at (delivery, sequence).
  virtual grpc::ServerUnaryReactor* GetEventLog(
      grpc::CallbackServerContext* context,
      const waybill::v1::GetEventLogRequest* request,
      waybill::v1::GetEventLogResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetLatestSequence(
      grpc::CallbackServerContext* context,
      const waybill::v1::DeliveryRequest* request,
      waybill::v1::GetLatestSequenceResponse* response) override final;

  virtual grpc::ServerUnaryReactor* IsDeliveryCompleted(
      grpc::CallbackServerContext* context,
      const waybill::v1::DeliveryRequest* request,
      waybill::v1::IsDeliveryCompletedResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetFailureReason(
      grpc::CallbackServerContext* context,
      const waybill::v1::DeliveryRequest* request,
      waybill::v1::GetFailureReasonResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetOracles(
      grpc::CallbackServerContext* context,
      const waybill::v1::EmptyRequest* request,
      waybill::v1::GetOraclesResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetContractPaused(
      grpc::CallbackServerContext* context,
      const waybill::v1::EmptyRequest* request,
      waybill::v1::GetContractPausedResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetContractOwner(
      grpc::CallbackServerContext* context,
      const waybill::v1::EmptyRequest* request,
      waybill::v1::GetContractOwnerResponse* response) override final;

  virtual grpc::ServerUnaryReactor* HasRole(
      grpc::CallbackServerContext* context,
      const waybill::v1::HasRoleRequest* request,
      waybill::v1::HasRoleResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetRoles(
      grpc::CallbackServerContext* context,
      const waybill::v1::GetRolesRequest* request,
      waybill::v1::GetRolesResponse* response) override final;

  /// Application name, version and current logical time.
  virtual grpc::ServerUnaryReactor* Info(
      grpc::CallbackServerContext* context,
      const waybill::v1::EmptyRequest* request,
      waybill::v1::InfoResponse* response) override final;

  waybill::ledger::ledger_context& context_;
  waybill::ledger::role_registry& roles_;
  waybill::ledger::delivery_ledger& ledger_;
  waybill::ledger::query_service& queries_;
};

}  // namespace waybill::rpc
