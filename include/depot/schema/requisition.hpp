#pragma once
#include <depot/schema/approval_record.hpp>
#include <depot/schema/requisition_item_state.hpp>
#include <depot/schema/requisition_state.hpp>
#include <vector>

namespace depot::schema {

/// Requisition aggregate as returned to callers: header, lines in creation
/// order and approvals in append order.
struct requisition_t final {
  requisition_state_t header;
  std::vector<requisition_item_state_t> items;
  std::vector<approval_record_t> approvals;
};

}  // namespace depot::schema
