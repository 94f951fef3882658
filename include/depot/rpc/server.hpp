#pragma once

#include <depot/v1/requisition_service.grpc.pb.h>
#include <depot/execution/engine.hpp>

namespace depot::rpc {

/// Default page size of ListHistory when the request leaves limit at 0.
inline constexpr uint32_t kDefaultHistoryLimit = 50;

/// Callback gRPC front of the requisition engine.
///
/// Every handler answers with transport status OK; domain outcomes travel in
/// the response Status header (code, log, info, codespace). Quantities cross
/// the wire as double and are rounded to thousandths on the way in.
struct listener final : public depot::v1::RequisitionService::CallbackService {
  explicit listener(depot::execution::engine& engine);

  grpc::ServerUnaryReactor* Authenticate(
      grpc::CallbackServerContext* context,
      const depot::v1::AuthenticateRequest* request,
      depot::v1::AuthenticateResponse* response) override final;

  grpc::ServerUnaryReactor* SubmitRequisition(
      grpc::CallbackServerContext* context,
      const depot::v1::SubmitRequisitionRequest* request,
      depot::v1::RequisitionResponse* response) override final;

  grpc::ServerUnaryReactor* DecideRequisition(
      grpc::CallbackServerContext* context,
      const depot::v1::DecideRequisitionRequest* request,
      depot::v1::DecideRequisitionResponse* response) override final;

  /// Look a requisition up by id or by code.
  grpc::ServerUnaryReactor* GetRequisition(
      grpc::CallbackServerContext* context,
      const depot::v1::GetRequisitionRequest* request,
      depot::v1::RequisitionResponse* response) override final;

  grpc::ServerUnaryReactor* ListByRequester(
      grpc::CallbackServerContext* context,
      const depot::v1::ListByRequesterRequest* request,
      depot::v1::RequisitionListResponse* response) override final;

  grpc::ServerUnaryReactor* ListPending(
      grpc::CallbackServerContext* context,
      const depot::v1::ListPendingRequest* request,
      depot::v1::RequisitionListResponse* response) override final;

  grpc::ServerUnaryReactor* ListHistory(
      grpc::CallbackServerContext* context,
      const depot::v1::ListHistoryRequest* request,
      depot::v1::RequisitionListResponse* response) override final;

  grpc::ServerUnaryReactor* GetInventory(
      grpc::CallbackServerContext* context,
      const depot::v1::GetInventoryRequest* request,
      depot::v1::GetInventoryResponse* response) override final;

 private:
  depot::execution::engine& engine_;
};

}  // namespace depot::rpc
