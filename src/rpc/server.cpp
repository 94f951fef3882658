#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <depot/rpc/server.hpp>
#include <optional>
#include <variant>
#include <string>

using namespace depot::rpc;
using namespace depot::schema;

namespace {

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

template <typename T>
void populate_status(const operation_result<T>& source,
                     depot::v1::Status* destination) {
  destination->set_code(source.code);
  destination->set_log(source.log);
  destination->set_info(source.info);
  destination->set_codespace(source.codespace);
}

void populate_error(const error_code code,
                    const std::string_view codespace,
                    std::string info,
                    depot::v1::Status* destination) {
  populate_status(make_error<std::monostate>(code, codespace, std::move(info)),
                  destination);
}

depot::v1::RequisitionStatus to_proto(const requisition_status_t status) {
  switch (status) {
    case requisition_status_t::pending:
      return depot::v1::REQUISITION_STATUS_PENDING;
    case requisition_status_t::approved:
      return depot::v1::REQUISITION_STATUS_APPROVED;
    case requisition_status_t::partially_approved:
      return depot::v1::REQUISITION_STATUS_PARTIALLY_APPROVED;
    case requisition_status_t::rejected:
      return depot::v1::REQUISITION_STATUS_REJECTED;
    case requisition_status_t::cancelled:
      return depot::v1::REQUISITION_STATUS_CANCELLED;
  }
  return depot::v1::REQUISITION_STATUS_UNSPECIFIED;
}

depot::v1::Decision to_proto(const decision_t decision) {
  switch (decision) {
    case decision_t::approve:
      return depot::v1::DECISION_APPROVE;
    case decision_t::reject:
      return depot::v1::DECISION_REJECT;
  }
  return depot::v1::DECISION_UNSPECIFIED;
}

depot::v1::Role to_proto(const role_id_t role) {
  switch (role) {
    case role_id_t::requester:
      return depot::v1::ROLE_REQUESTER;
    case role_id_t::approver:
      return depot::v1::ROLE_APPROVER;
    case role_id_t::administrator:
      return depot::v1::ROLE_ADMINISTRATOR;
  }
  return depot::v1::ROLE_UNSPECIFIED;
}

std::optional<decision_t> from_proto(const depot::v1::Decision decision) {
  switch (decision) {
    case depot::v1::DECISION_APPROVE:
      return decision_t::approve;
    case depot::v1::DECISION_REJECT:
      return decision_t::reject;
    case depot::v1::DECISION_UNSPECIFIED:
    default:
      return std::nullopt;
  }
}

void populate_requisition(const requisition_t& source,
                          depot::v1::Requisition* destination) {
  const auto& header = source.header;
  destination->set_requisition_id(header.requisition_id);
  destination->set_code(header.code);
  destination->set_requester_id(header.requester_id);
  if (header.machine_id) {
    destination->set_machine_id(*header.machine_id);
  }
  if (header.area_id) {
    destination->set_area_id(*header.area_id);
  }
  destination->set_status(to_proto(header.status));
  destination->set_created_at_ms(header.created_at);
  destination->set_updated_at_ms(header.updated_at);
  destination->set_note(header.note);
  for (const auto& item : source.items) {
    auto* out = destination->add_items();
    out->set_requisition_item_id(item.requisition_item_id);
    out->set_inventory_item_id(item.inventory_item_id);
    out->set_requested(to_double(item.requested));
    if (item.approved) {
      out->set_approved(to_double(*item.approved));
    }
  }
  for (const auto& approval : source.approvals) {
    auto* out = destination->add_approvals();
    out->set_approval_id(approval.approval_id);
    out->set_approver_id(approval.approver_id);
    out->set_decision(to_proto(approval.decision));
    out->set_comment(approval.comment);
    out->set_decided_at_ms(approval.decided_at);
    out->set_digest(make_string(
        bytes_view_t{approval.digest.data(), approval.digest.size()}));
  }
}

void populate_requisitions(
    const operation_result<std::vector<requisition_t>>& result,
    depot::v1::RequisitionListResponse* response) {
  populate_status(result, response->mutable_status());
  if (!result.value) {
    return;
  }
  for (const auto& requisition : *result.value) {
    populate_requisition(requisition, response->add_requisitions());
  }
}

}  // namespace

listener::listener(depot::execution::engine& engine) : engine_{engine} {}

grpc::ServerUnaryReactor* listener::Authenticate(
    grpc::CallbackServerContext* context,
    const depot::v1::AuthenticateRequest* request,
    depot::v1::AuthenticateResponse* response) {
  auto result = engine_.authenticate(request->username(), request->password());
  populate_status(result, response->mutable_status());
  if (result.value) {
    response->set_user_id(result.value->user_id);
    response->set_username(result.value->username);
    response->set_display_name(result.value->display_name);
    response->set_role(to_proto(result.value->role));
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::SubmitRequisition(
    grpc::CallbackServerContext* context,
    const depot::v1::SubmitRequisitionRequest* request,
    depot::v1::RequisitionResponse* response) {
  auto submit = submit_requisition_t{};
  submit.requester_id = request->requester_id();
  if (request->has_machine_id()) {
    submit.machine_id = request->machine_id();
  }
  if (request->has_area_id()) {
    submit.area_id = request->area_id();
  }
  if (request->has_note()) {
    submit.note = request->note();
  }
  for (const auto& line : request->items()) {
    auto quantity = try_quantity_from_double(line.quantity());
    if (!quantity) {
      populate_error(error_code::invalid_quantity, kCodespaceSubmit,
                     fmt::format("quantity of inventory item {} is not a "
                                 "finite number",
                                 line.inventory_item_id()),
                     response->mutable_status());
      return finish_ok(context);
    }
    submit.lines.push_back(requisition_line_t{
        .inventory_item_id = line.inventory_item_id(), .quantity = *quantity});
  }

  auto result = engine_.submit_requisition(submit);
  populate_status(result, response->mutable_status());
  if (result.value) {
    populate_requisition(*result.value, response->mutable_requisition());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::DecideRequisition(
    grpc::CallbackServerContext* context,
    const depot::v1::DecideRequisitionRequest* request,
    depot::v1::DecideRequisitionResponse* response) {
  auto decision = from_proto(request->decision());
  if (!decision) {
    populate_error(error_code::invalid_argument, kCodespaceDecide,
                   fmt::format("unknown decision {}",
                               static_cast<int>(request->decision())),
                   response->mutable_status());
    return finish_ok(context);
  }

  auto decide = decide_requisition_t{};
  decide.requisition_id = request->requisition_id();
  decide.approver_id = request->approver_id();
  decide.decision = *decision;
  if (request->has_comment()) {
    decide.comment = request->comment();
  }
  for (const auto& [item_id, value] : request->approved_quantities()) {
    auto quantity = try_quantity_from_double(value);
    if (!quantity) {
      populate_error(error_code::invalid_approved_quantity, kCodespaceDecide,
                     fmt::format("approved quantity of item {} is not a "
                                 "finite number",
                                 item_id),
                     response->mutable_status());
      return finish_ok(context);
    }
    decide.approved_quantities.emplace(item_id, *quantity);
  }

  auto result = engine_.decide_requisition(decide);
  populate_status(result, response->mutable_status());
  if (result.value) {
    populate_requisition(result.value->requisition,
                         response->mutable_requisition());
    for (const auto& shortfall : result.value->shortfalls) {
      auto* out = response->add_shortfalls();
      out->set_requisition_item_id(shortfall.requisition_item_id);
      out->set_inventory_item_id(shortfall.inventory_item_id);
      out->set_wanted(to_double(shortfall.wanted));
      out->set_applied(to_double(shortfall.applied));
      out->set_shortfall(to_double(shortfall.shortfall));
    }
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetRequisition(
    grpc::CallbackServerContext* context,
    const depot::v1::GetRequisitionRequest* request,
    depot::v1::RequisitionResponse* response) {
  auto result = operation_result<requisition_t>{};
  switch (request->selector_case()) {
    case depot::v1::GetRequisitionRequest::kRequisitionId:
      result = engine_.get_requisition(request->requisition_id());
      break;
    case depot::v1::GetRequisitionRequest::kCode:
      result = engine_.get_requisition_by_code(request->code());
      break;
    case depot::v1::GetRequisitionRequest::SELECTOR_NOT_SET:
      result = make_error<requisition_t>(error_code::invalid_argument,
                                         kCodespaceQuery,
                                         "requisition id or code required");
      break;
  }
  populate_status(result, response->mutable_status());
  if (result.value) {
    populate_requisition(*result.value, response->mutable_requisition());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::ListByRequester(
    grpc::CallbackServerContext* context,
    const depot::v1::ListByRequesterRequest* request,
    depot::v1::RequisitionListResponse* response) {
  populate_requisitions(engine_.list_by_requester(request->requester_id()),
                        response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::ListPending(
    grpc::CallbackServerContext* context,
    const depot::v1::ListPendingRequest*,
    depot::v1::RequisitionListResponse* response) {
  populate_requisitions(engine_.list_pending(), response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::ListHistory(
    grpc::CallbackServerContext* context,
    const depot::v1::ListHistoryRequest* request,
    depot::v1::RequisitionListResponse* response) {
  auto limit = request->limit() == 0 ? kDefaultHistoryLimit : request->limit();
  populate_requisitions(engine_.list_history(limit), response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetInventory(
    grpc::CallbackServerContext* context,
    const depot::v1::GetInventoryRequest*,
    depot::v1::GetInventoryResponse* response) {
  auto result = engine_.get_inventory();
  populate_status(result, response->mutable_status());
  if (result.value) {
    for (const auto& item : *result.value) {
      auto* out = response->add_items();
      out->set_inventory_item_id(item.inventory_item_id);
      out->set_sku(item.sku);
      out->set_description(item.description);
      out->set_stock(to_double(item.stock));
      out->set_unit(item.unit);
    }
  }
  return finish_ok(context);
}
