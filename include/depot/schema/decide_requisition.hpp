#pragma once
#include <depot/schema/decision.hpp>
#include <depot/schema/primitives.hpp>
#include <depot/schema/quantity.hpp>
#include <depot/schema/requisition.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace depot::schema {

template <uint16_t Version> struct decide_requisition;

template <> struct decide_requisition<1> final {
  uint16_t version{1};
  requisition_id_t requisition_id{};
  user_id_t approver_id{};
  decision_t decision{decision_t::approve};
  std::map<requisition_item_id_t, quantity_t> approved_quantities;
  std::optional<std::string> comment;
};

using decide_requisition_t = decide_requisition<1>;

/// Reported when an approved quantity exceeded the stock on hand and only the
/// available amount was deducted.
struct stock_shortfall_t final {
  requisition_item_id_t requisition_item_id{};
  inventory_item_id_t inventory_item_id{};
  quantity_t wanted;
  quantity_t applied;
  quantity_t shortfall;
};

struct decision_outcome_t final {
  requisition_t requisition;
  std::vector<stock_shortfall_t> shortfalls;
};

}  // namespace depot::schema
