#pragma once
#include <depot/schema/primitives.hpp>
#include <depot/schema/quantity.hpp>
#include <optional>

namespace depot::schema {

template <uint16_t Version> struct requisition_item_state;

// approved stays empty until the requisition is decided, then
// 0 <= approved <= requested.
template <> struct requisition_item_state<1> final {
  uint16_t version{1};
  requisition_item_id_t requisition_item_id{};
  requisition_id_t requisition_id{};
  inventory_item_id_t inventory_item_id{};
  quantity_t requested;
  std::optional<quantity_t> approved;
};

using requisition_item_state_t = requisition_item_state<1>;

}  // namespace depot::schema
