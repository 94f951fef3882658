#pragma once
#include <depot/schema/requisition_item_state.hpp>
#include <depot/schema/requisition_state.hpp>
#include <depot/store/types.hpp>
#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace depot::store {

/// Requisition headers and lines plus the code, requester and pending
/// indexes. Records are never physically deleted.
class requisition_store final {
 public:
  explicit requisition_store(encoder_t& encoder);

  depot::schema::requisition_id_t allocate_requisition_id(
      transaction_t& txn) const;
  depot::schema::requisition_item_id_t allocate_item_id(
      transaction_t& txn) const;

  /// Persist a new pending requisition, its lines and every index entry.
  void insert(transaction_t& txn,
              const depot::schema::requisition_state_t& header,
              const std::vector<depot::schema::requisition_item_state_t>&
                  items) const;

  /// Rewrite the header; a header leaving pending drops its pending index.
  void update(transaction_t& txn,
              const depot::schema::requisition_state_t& header) const;
  void update_item(transaction_t& txn,
                   const depot::schema::requisition_item_state_t& item) const;

  std::optional<depot::schema::requisition_state_t> find(
      transaction_t& txn,
      depot::schema::requisition_id_t requisition_id) const;

  /// Read the header under an exclusive row lock.
  std::optional<depot::schema::requisition_state_t> lock(
      transaction_t& txn,
      depot::schema::requisition_id_t requisition_id) const;

  std::optional<depot::schema::requisition_id_t> find_id_by_code(
      transaction_t& txn,
      std::string_view code) const;

  /// Lines in creation order.
  std::vector<depot::schema::requisition_item_state_t> list_items(
      transaction_t& txn,
      depot::schema::requisition_id_t requisition_id) const;

  /// Newest first.
  std::vector<depot::schema::requisition_state_t> list_by_requester(
      transaction_t& txn,
      depot::schema::user_id_t requester_id) const;

  /// Oldest first.
  std::vector<depot::schema::requisition_state_t> list_pending(
      transaction_t& txn) const;

  /// Newest first, at most limit headers regardless of status.
  std::vector<depot::schema::requisition_state_t> list_recent(
      transaction_t& txn,
      std::size_t limit) const;

 private:
  std::vector<depot::schema::requisition_state_t> load_headers(
      transaction_t& txn,
      const std::vector<depot::storage::key_value_entry_t>& index) const;

  encoder_t& encoder_;
};

}  // namespace depot::store
