#pragma once
#include <depot/schema/primitives.hpp>
#include <depot/schema/quantity.hpp>
#include <optional>
#include <string>
#include <vector>

namespace depot::schema {

struct requisition_line_t final {
  inventory_item_id_t inventory_item_id{};
  quantity_t quantity;
};

template <uint16_t Version> struct submit_requisition;

template <> struct submit_requisition<1> final {
  uint16_t version{1};
  user_id_t requester_id{};
  std::optional<machine_id_t> machine_id;
  std::optional<area_id_t> area_id;
  std::vector<requisition_line_t> lines;
  std::optional<std::string> note;
};

using submit_requisition_t = submit_requisition<1>;

}  // namespace depot::schema
