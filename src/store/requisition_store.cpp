#include <depot/common/critical.hpp>
#include <depot/schema/key/store_keys.hpp>
#include <depot/store/requisition_store.hpp>
#include <depot/store/sequence.hpp>
#include <limits>

using namespace depot::schema;
namespace key = depot::schema::key;

namespace depot::store {

requisition_store::requisition_store(encoder_t& encoder)
    : encoder_{encoder} {}

requisition_id_t requisition_store::allocate_requisition_id(
    transaction_t& txn) const {
  return next_sequence(encoder_, txn, key::kRequisitionSequence);
}

requisition_item_id_t requisition_store::allocate_item_id(
    transaction_t& txn) const {
  return next_sequence(encoder_, txn, key::kRequisitionLineSequence);
}

void requisition_store::insert(
    transaction_t& txn,
    const requisition_state_t& header,
    const std::vector<requisition_item_state_t>& items) const {
  auto id = header.requisition_id;
  txn.put(encoder_, key::make_requisition_key(id), header);
  for (const auto& item : items) {
    txn.put(encoder_,
            key::make_requisition_line_key(id, item.requisition_item_id),
            item);
  }
  txn.put(encoder_, key::make_code_index_key(header.code), id);
  txn.put(encoder_, key::make_requester_index_key(header.requester_id, id),
          id);
  if (header.status == requisition_status_t::pending) {
    txn.put(encoder_, key::make_pending_index_key(id), id);
  }
}

void requisition_store::update(transaction_t& txn,
                               const requisition_state_t& header) const {
  auto id = header.requisition_id;
  txn.put(encoder_, key::make_requisition_key(id), header);
  if (header.status != requisition_status_t::pending) {
    txn.erase(key::make_pending_index_key(id));
  }
}

void requisition_store::update_item(
    transaction_t& txn,
    const requisition_item_state_t& item) const {
  txn.put(encoder_,
          key::make_requisition_line_key(item.requisition_id,
                                         item.requisition_item_id),
          item);
}

std::optional<requisition_state_t> requisition_store::find(
    transaction_t& txn,
    const requisition_id_t requisition_id) const {
  return txn.get<requisition_state_t>(
      encoder_, key::make_requisition_key(requisition_id));
}

std::optional<requisition_state_t> requisition_store::lock(
    transaction_t& txn,
    const requisition_id_t requisition_id) const {
  return txn.get_for_update<requisition_state_t>(
      encoder_, key::make_requisition_key(requisition_id));
}

std::optional<requisition_id_t> requisition_store::find_id_by_code(
    transaction_t& txn,
    const std::string_view code) const {
  return txn.get<requisition_id_t>(encoder_, key::make_code_index_key(code));
}

std::vector<requisition_item_state_t> requisition_store::list_items(
    transaction_t& txn,
    const requisition_id_t requisition_id) const {
  return decode_values<requisition_item_state_t>(
      encoder_,
      txn.list_by_prefix(key::make_requisition_line_prefix(requisition_id)));
}

std::vector<requisition_state_t> requisition_store::list_by_requester(
    transaction_t& txn,
    const user_id_t requester_id) const {
  return load_headers(
      txn, txn.list_by_prefix_reverse(
               key::make_requester_index_prefix(requester_id),
               std::numeric_limits<std::size_t>::max()));
}

std::vector<requisition_state_t> requisition_store::list_pending(
    transaction_t& txn) const {
  return load_headers(
      txn, txn.list_by_prefix(key::make_prefix(key::kPendingIndexPrefix)));
}

std::vector<requisition_state_t> requisition_store::list_recent(
    transaction_t& txn,
    const std::size_t limit) const {
  return decode_values<requisition_state_t>(
      encoder_,
      txn.list_by_prefix_reverse(key::make_prefix(key::kRequisitionKeyPrefix),
                                 limit));
}

std::vector<requisition_state_t> requisition_store::load_headers(
    transaction_t& txn,
    const std::vector<depot::storage::key_value_entry_t>& index) const {
  auto headers = std::vector<requisition_state_t>{};
  headers.reserve(index.size());
  for (const auto& entry : index) {
    auto id = encoder_.decode<requisition_id_t>(entry.second);
    auto header = find(txn, id);
    if (!header) {
      depot::common::critical("requisition index points at a missing row");
    }
    headers.push_back(std::move(*header));
  }
  return headers;
}

}  // namespace depot::store
