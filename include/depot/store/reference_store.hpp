#pragma once
#include <depot/schema/area_state.hpp>
#include <depot/schema/machine_state.hpp>
#include <depot/schema/user_state.hpp>
#include <depot/store/types.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace depot::store {

/// Users, areas and machines with their natural-key uniqueness indexes.
///
/// Insertions lock the index row of the natural key, so two concurrent
/// registrations of the same username/code cannot both succeed.
class reference_store final {
 public:
  explicit reference_store(encoder_t& encoder);

  std::optional<depot::schema::user_state_t> find_user(
      transaction_t& txn,
      depot::schema::user_id_t user_id) const;
  std::optional<depot::schema::user_state_t> lock_user(
      transaction_t& txn,
      depot::schema::user_id_t user_id) const;
  std::optional<depot::schema::user_state_t> find_user_by_username(
      transaction_t& txn,
      std::string_view username) const;
  std::vector<depot::schema::user_state_t> list_users(
      transaction_t& txn) const;

  /// Number of users ever registered. Locks the user counter row so that
  /// bootstrap checks serialize with registrations.
  uint64_t lock_user_count(transaction_t& txn) const;

  /// Assign an id and persist. std::nullopt when the username is taken.
  std::optional<depot::schema::user_state_t> insert_user(
      transaction_t& txn,
      depot::schema::user_state_t user) const;
  void update_user(transaction_t& txn,
                   const depot::schema::user_state_t& user) const;

  std::optional<depot::schema::area_state_t> find_area(
      transaction_t& txn,
      depot::schema::area_id_t area_id) const;
  std::vector<depot::schema::area_state_t> list_areas(
      transaction_t& txn) const;
  std::optional<depot::schema::area_state_t> insert_area(
      transaction_t& txn,
      depot::schema::area_state_t area) const;

  std::optional<depot::schema::machine_state_t> find_machine(
      transaction_t& txn,
      depot::schema::machine_id_t machine_id) const;
  std::vector<depot::schema::machine_state_t> list_machines(
      transaction_t& txn) const;
  std::optional<depot::schema::machine_state_t> insert_machine(
      transaction_t& txn,
      depot::schema::machine_state_t machine) const;

 private:
  encoder_t& encoder_;
};

}  // namespace depot::store
