#include <depot/rpc/server.hpp>
#include <depot/testing/engine_fixture.hpp>
#include <grpcpp/grpcpp.h>
#include <gtest/gtest.h>

#include <limits>
#include <memory>

using depot::schema::error_code;

namespace {

class server_test : public ::testing::Test {
 protected:
  void SetUp() override {
    auto builder = grpc::ServerBuilder{};
    builder.RegisterService(&listener_);
    server_ = builder.BuildAndStart();
    ASSERT_NE(server_, nullptr);
    stub_ = depot::v1::RequisitionService::NewStub(
        server_->InProcessChannel(grpc::ChannelArguments{}));
  }

  void TearDown() override {
    stub_.reset();
    server_->Shutdown();
    server_->Wait();
  }

  depot::v1::RequisitionResponse submit(const double quantity) {
    auto context = grpc::ClientContext{};
    auto request = depot::v1::SubmitRequisitionRequest{};
    request.set_requester_id(fixture_.requester_id());
    auto* line = request.add_items();
    line->set_inventory_item_id(fixture_.filter_id());
    line->set_quantity(quantity);
    auto response = depot::v1::RequisitionResponse{};
    EXPECT_TRUE(stub_->SubmitRequisition(&context, request, &response).ok());
    return response;
  }

  depot::testing::engine_fixture fixture_{"depot_rpc"};
  depot::rpc::listener listener_{fixture_.engine()};
  std::unique_ptr<grpc::Server> server_;
  std::unique_ptr<depot::v1::RequisitionService::Stub> stub_;
};

}  // namespace

TEST_F(server_test, authenticate_reports_identity_or_domain_error) {
  auto context = grpc::ClientContext{};
  auto request = depot::v1::AuthenticateRequest{};
  request.set_username("approver");
  request.set_password(std::string{depot::testing::kTestPassword});
  auto response = depot::v1::AuthenticateResponse{};
  ASSERT_TRUE(stub_->Authenticate(&context, request, &response).ok());
  EXPECT_EQ(response.status().code(), 0u);
  EXPECT_EQ(response.user_id(), fixture_.approver_id());
  EXPECT_EQ(response.role(), depot::v1::ROLE_APPROVER);

  auto retry_context = grpc::ClientContext{};
  request.set_password("wrong");
  response.Clear();
  ASSERT_TRUE(stub_->Authenticate(&retry_context, request, &response).ok());
  EXPECT_EQ(response.status().code(),
            static_cast<uint32_t>(error_code::invalid_credentials));
  EXPECT_EQ(response.status().codespace(), "depot.auth");
  EXPECT_EQ(response.user_id(), 0u);
}

TEST_F(server_test, submit_converts_quantities_and_rejects_non_finite) {
  auto created = submit(2.5);
  EXPECT_EQ(created.status().code(), 0u);
  EXPECT_EQ(created.requisition().code(), "REQ-20250314-0001");
  EXPECT_EQ(created.requisition().status(),
            depot::v1::REQUISITION_STATUS_PENDING);
  ASSERT_EQ(created.requisition().items_size(), 1);
  EXPECT_DOUBLE_EQ(created.requisition().items(0).requested(), 2.5);
  EXPECT_FALSE(created.requisition().items(0).has_approved());
  EXPECT_FALSE(created.requisition().has_machine_id());

  auto invalid = submit(std::numeric_limits<double>::quiet_NaN());
  EXPECT_EQ(invalid.status().code(),
            static_cast<uint32_t>(error_code::invalid_quantity));
  EXPECT_EQ(invalid.status().codespace(), "depot.submit");
  EXPECT_FALSE(invalid.has_requisition());
}

TEST_F(server_test, decide_returns_requisition_and_shortfalls) {
  auto created = submit(3);
  ASSERT_EQ(created.status().code(), 0u);

  auto context = grpc::ClientContext{};
  auto request = depot::v1::DecideRequisitionRequest{};
  request.set_requisition_id(created.requisition().requisition_id());
  request.set_approver_id(fixture_.approver_id());
  request.set_decision(depot::v1::DECISION_APPROVE);
  (*request.mutable_approved_quantities())
      [created.requisition().items(0).requisition_item_id()] = 2;
  request.set_comment("parcial");
  auto response = depot::v1::DecideRequisitionResponse{};
  ASSERT_TRUE(stub_->DecideRequisition(&context, request, &response).ok());
  EXPECT_EQ(response.status().code(), 0u);
  EXPECT_EQ(response.requisition().status(),
            depot::v1::REQUISITION_STATUS_PARTIALLY_APPROVED);
  ASSERT_TRUE(response.requisition().items(0).has_approved());
  EXPECT_DOUBLE_EQ(response.requisition().items(0).approved(), 2.0);
  ASSERT_EQ(response.requisition().approvals_size(), 1);
  EXPECT_EQ(response.requisition().approvals(0).comment(), "parcial");
  EXPECT_EQ(response.requisition().approvals(0).digest().size(), 32u);
  EXPECT_EQ(response.shortfalls_size(), 0);

  auto again_context = grpc::ClientContext{};
  response.Clear();
  ASSERT_TRUE(
      stub_->DecideRequisition(&again_context, request, &response).ok());
  EXPECT_EQ(response.status().code(),
            static_cast<uint32_t>(error_code::invalid_state_transition));

  auto inventory_context = grpc::ClientContext{};
  auto inventory = depot::v1::GetInventoryResponse{};
  ASSERT_TRUE(stub_
                  ->GetInventory(&inventory_context,
                                 depot::v1::GetInventoryRequest{}, &inventory)
                  .ok());
  ASSERT_EQ(inventory.items_size(), 2);
  EXPECT_EQ(inventory.items(0).sku(), "SKU-001");
  EXPECT_DOUBLE_EQ(inventory.items(0).stock(), 8.0);
}

TEST_F(server_test, decide_without_decision_leaves_requisition_pending) {
  auto created = submit(3);
  ASSERT_EQ(created.status().code(), 0u);

  auto context = grpc::ClientContext{};
  auto request = depot::v1::DecideRequisitionRequest{};
  request.set_requisition_id(created.requisition().requisition_id());
  request.set_approver_id(fixture_.approver_id());
  auto response = depot::v1::DecideRequisitionResponse{};
  ASSERT_TRUE(stub_->DecideRequisition(&context, request, &response).ok());
  EXPECT_EQ(response.status().code(),
            static_cast<uint32_t>(error_code::invalid_argument));
  EXPECT_EQ(response.status().codespace(), "depot.decide");
  EXPECT_FALSE(response.has_requisition());

  auto get_context = grpc::ClientContext{};
  auto get = depot::v1::GetRequisitionRequest{};
  get.set_requisition_id(created.requisition().requisition_id());
  auto current = depot::v1::RequisitionResponse{};
  ASSERT_TRUE(stub_->GetRequisition(&get_context, get, &current).ok());
  EXPECT_EQ(current.requisition().status(),
            depot::v1::REQUISITION_STATUS_PENDING);
  EXPECT_EQ(current.requisition().approvals_size(), 0);
  EXPECT_FALSE(current.requisition().items(0).has_approved());
  EXPECT_EQ(fixture_.stock_of(fixture_.filter_id()),
            depot::testing::units(10));
}

TEST_F(server_test, get_requisition_by_id_code_or_neither) {
  auto created = submit(1);
  ASSERT_EQ(created.status().code(), 0u);

  auto by_code_context = grpc::ClientContext{};
  auto by_code = depot::v1::GetRequisitionRequest{};
  by_code.set_code("REQ-20250314-0001");
  auto response = depot::v1::RequisitionResponse{};
  ASSERT_TRUE(stub_->GetRequisition(&by_code_context, by_code, &response).ok());
  EXPECT_EQ(response.requisition().requisition_id(),
            created.requisition().requisition_id());

  auto by_id_context = grpc::ClientContext{};
  auto by_id = depot::v1::GetRequisitionRequest{};
  by_id.set_requisition_id(404);
  response.Clear();
  ASSERT_TRUE(stub_->GetRequisition(&by_id_context, by_id, &response).ok());
  EXPECT_EQ(response.status().code(),
            static_cast<uint32_t>(error_code::requisition_missing));

  auto empty_context = grpc::ClientContext{};
  response.Clear();
  ASSERT_TRUE(stub_
                  ->GetRequisition(&empty_context,
                                   depot::v1::GetRequisitionRequest{},
                                   &response)
                  .ok());
  EXPECT_EQ(response.status().code(),
            static_cast<uint32_t>(error_code::invalid_argument));
}

TEST_F(server_test, listings_use_the_default_history_limit) {
  for (auto i = 0; i < 3; ++i) {
    ASSERT_EQ(submit(1).status().code(), 0u);
  }

  auto history_context = grpc::ClientContext{};
  auto history = depot::v1::RequisitionListResponse{};
  ASSERT_TRUE(stub_
                  ->ListHistory(&history_context,
                                depot::v1::ListHistoryRequest{}, &history)
                  .ok());
  EXPECT_EQ(history.status().code(), 0u);
  ASSERT_EQ(history.requisitions_size(), 3);
  EXPECT_EQ(history.requisitions(0).code(), "REQ-20250314-0003");

  auto pending_context = grpc::ClientContext{};
  auto pending = depot::v1::RequisitionListResponse{};
  ASSERT_TRUE(stub_
                  ->ListPending(&pending_context,
                                depot::v1::ListPendingRequest{}, &pending)
                  .ok());
  ASSERT_EQ(pending.requisitions_size(), 3);
  EXPECT_EQ(pending.requisitions(0).code(), "REQ-20250314-0001");

  auto mine_context = grpc::ClientContext{};
  auto mine_request = depot::v1::ListByRequesterRequest{};
  mine_request.set_requester_id(999);
  auto mine = depot::v1::RequisitionListResponse{};
  ASSERT_TRUE(
      stub_->ListByRequester(&mine_context, mine_request, &mine).ok());
  EXPECT_EQ(mine.status().code(),
            static_cast<uint32_t>(error_code::unknown_requester));
  EXPECT_EQ(mine.requisitions_size(), 0);
}
