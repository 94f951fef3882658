#include <spdlog/spdlog.h>
#include <depot/ledger/inventory_ledger.hpp>
#include <depot/schema/key/store_keys.hpp>
#include <depot/store/sequence.hpp>
#include <algorithm>

using namespace depot::schema;
namespace key = depot::schema::key;

namespace depot::ledger {

inventory_ledger::inventory_ledger(depot::store::encoder_t& encoder)
    : encoder_{encoder} {}

std::optional<inventory_item_state_t> inventory_ledger::find(
    depot::store::transaction_t& txn,
    const inventory_item_id_t item_id) const {
  return txn.get<inventory_item_state_t>(encoder_,
                                         key::make_inventory_key(item_id));
}

std::optional<quantity_t> inventory_ledger::get(
    depot::store::transaction_t& txn,
    const inventory_item_id_t item_id) const {
  auto item = find(txn, item_id);
  if (!item) {
    return std::nullopt;
  }
  return item->stock;
}

std::vector<inventory_item_state_t> inventory_ledger::list(
    depot::store::transaction_t& txn) const {
  return depot::store::decode_values<inventory_item_state_t>(
      encoder_, txn.list_by_prefix(key::make_prefix(key::kInventoryKeyPrefix)));
}

std::optional<inventory_item_state_t> inventory_ledger::register_item(
    depot::store::transaction_t& txn,
    std::string sku,
    std::string description,
    const quantity_t stock,
    std::string unit) const {
  auto index_key = key::make_sku_index_key(sku);
  if (txn.get_for_update<inventory_item_id_t>(encoder_, index_key)) {
    return std::nullopt;
  }
  auto item = inventory_item_state_t{};
  item.inventory_item_id =
      depot::store::next_sequence(encoder_, txn, key::kInventorySequence);
  item.sku = std::move(sku);
  item.description = std::move(description);
  item.stock = stock;
  if (!unit.empty()) {
    item.unit = std::move(unit);
  }
  txn.put(encoder_, key::make_inventory_key(item.inventory_item_id), item);
  txn.put(encoder_, index_key, item.inventory_item_id);
  return item;
}

std::optional<decrement_result_t> inventory_ledger::decrement(
    depot::store::transaction_t& txn,
    const inventory_item_id_t item_id,
    const quantity_t quantity) const {
  auto item_key = key::make_inventory_key(item_id);
  auto item = txn.get_for_update<inventory_item_state_t>(encoder_, item_key);
  if (!item) {
    return std::nullopt;
  }
  auto result = decrement_result_t{};
  result.previous_stock = item->stock;
  auto wanted = std::max(quantity, quantity_t{});
  result.applied = std::min(wanted, item->stock);
  result.shortfall = wanted - result.applied;
  result.new_stock = item->stock - result.applied;
  if (is_positive(result.applied)) {
    item->stock = result.new_stock;
    txn.put(encoder_, item_key, *item);
  }
  spdlog::debug("inventory {} ({}) stock {} -> {}, shortfall {}", item_id,
                item->sku, to_string(result.previous_stock),
                to_string(result.new_stock), to_string(result.shortfall));
  return result;
}

}  // namespace depot::ledger
