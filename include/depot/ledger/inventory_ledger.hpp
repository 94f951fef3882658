#pragma once
#include <depot/schema/inventory_item_state.hpp>
#include <depot/schema/quantity.hpp>
#include <depot/store/types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace depot::ledger {

/// Outcome of one locked stock decrement.
struct decrement_result_t final {
  depot::schema::quantity_t previous_stock;
  depot::schema::quantity_t new_stock;
  depot::schema::quantity_t applied;
  depot::schema::quantity_t shortfall;
};

/// Per-SKU stock. Decrements hold an exclusive lock on the item row for the
/// rest of the enclosing transaction; stock never goes below zero.
class inventory_ledger final {
 public:
  explicit inventory_ledger(depot::store::encoder_t& encoder);

  std::optional<depot::schema::inventory_item_state_t> find(
      depot::store::transaction_t& txn,
      depot::schema::inventory_item_id_t item_id) const;

  /// Current stock, unlocked read.
  std::optional<depot::schema::quantity_t> get(
      depot::store::transaction_t& txn,
      depot::schema::inventory_item_id_t item_id) const;

  /// All items in id order.
  std::vector<depot::schema::inventory_item_state_t> list(
      depot::store::transaction_t& txn) const;

  /// Assign an id and persist. std::nullopt when the SKU is taken.
  std::optional<depot::schema::inventory_item_state_t> register_item(
      depot::store::transaction_t& txn,
      std::string sku,
      std::string description,
      depot::schema::quantity_t stock,
      std::string unit) const;

  /// Reduce stock by quantity, clamped at zero. Any amount that could not be
  /// applied is returned as shortfall. std::nullopt when the item is unknown.
  std::optional<decrement_result_t> decrement(
      depot::store::transaction_t& txn,
      depot::schema::inventory_item_id_t item_id,
      depot::schema::quantity_t quantity) const;

 private:
  depot::store::encoder_t& encoder_;
};

}  // namespace depot::ledger
