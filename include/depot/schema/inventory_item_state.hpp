#pragma once
#include <depot/schema/primitives.hpp>
#include <depot/schema/quantity.hpp>
#include <string>

// Schema type: inventory item state.
// One row per SKU. stock is never negative; only the approval path lowers it.
namespace depot::schema {

inline constexpr std::string_view kDefaultUnit = "un";

template <uint16_t Version> struct inventory_item_state;

template <> struct inventory_item_state<1> final {
  uint16_t version{1};
  inventory_item_id_t inventory_item_id{};
  std::string sku;
  std::string description;
  quantity_t stock;
  std::string unit{kDefaultUnit};
};

using inventory_item_state_t = inventory_item_state<1>;

}  // namespace depot::schema
