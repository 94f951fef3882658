#include <depot/schema/key/store_keys.hpp>
#include <depot/store/reference_store.hpp>
#include <depot/store/sequence.hpp>

using namespace depot::schema;
namespace key = depot::schema::key;

namespace depot::store {

reference_store::reference_store(encoder_t& encoder) : encoder_{encoder} {}

std::optional<user_state_t> reference_store::find_user(
    transaction_t& txn,
    const user_id_t user_id) const {
  return txn.get<user_state_t>(encoder_, key::make_user_key(user_id));
}

std::optional<user_state_t> reference_store::lock_user(
    transaction_t& txn,
    const user_id_t user_id) const {
  return txn.get_for_update<user_state_t>(encoder_,
                                          key::make_user_key(user_id));
}

std::optional<user_state_t> reference_store::find_user_by_username(
    transaction_t& txn,
    const std::string_view username) const {
  auto user_id = txn.get<user_id_t>(encoder_,
                                    key::make_username_index_key(username));
  if (!user_id) {
    return std::nullopt;
  }
  return find_user(txn, *user_id);
}

std::vector<user_state_t> reference_store::list_users(
    transaction_t& txn) const {
  return decode_values<user_state_t>(
      encoder_, txn.list_by_prefix(key::make_prefix(key::kUserKeyPrefix)));
}

uint64_t reference_store::lock_user_count(transaction_t& txn) const {
  return txn
      .get_for_update<uint64_t>(encoder_,
                                key::make_sequence_key(key::kUserSequence))
      .value_or(0);
}

std::optional<user_state_t> reference_store::insert_user(
    transaction_t& txn,
    user_state_t user) const {
  auto index_key = key::make_username_index_key(user.username);
  if (txn.get_for_update<user_id_t>(encoder_, index_key)) {
    return std::nullopt;
  }
  user.user_id = next_sequence(encoder_, txn, key::kUserSequence);
  txn.put(encoder_, key::make_user_key(user.user_id), user);
  txn.put(encoder_, index_key, user.user_id);
  return user;
}

void reference_store::update_user(transaction_t& txn,
                                  const user_state_t& user) const {
  txn.put(encoder_, key::make_user_key(user.user_id), user);
}

std::optional<area_state_t> reference_store::find_area(
    transaction_t& txn,
    const area_id_t area_id) const {
  return txn.get<area_state_t>(encoder_, key::make_area_key(area_id));
}

std::vector<area_state_t> reference_store::list_areas(
    transaction_t& txn) const {
  return decode_values<area_state_t>(
      encoder_, txn.list_by_prefix(key::make_prefix(key::kAreaKeyPrefix)));
}

std::optional<area_state_t> reference_store::insert_area(
    transaction_t& txn,
    area_state_t area) const {
  auto index_key = key::make_area_code_index_key(area.code);
  if (txn.get_for_update<area_id_t>(encoder_, index_key)) {
    return std::nullopt;
  }
  area.area_id = next_sequence(encoder_, txn, key::kAreaSequence);
  txn.put(encoder_, key::make_area_key(area.area_id), area);
  txn.put(encoder_, index_key, area.area_id);
  return area;
}

std::optional<machine_state_t> reference_store::find_machine(
    transaction_t& txn,
    const machine_id_t machine_id) const {
  return txn.get<machine_state_t>(encoder_, key::make_machine_key(machine_id));
}

std::vector<machine_state_t> reference_store::list_machines(
    transaction_t& txn) const {
  return decode_values<machine_state_t>(
      encoder_, txn.list_by_prefix(key::make_prefix(key::kMachineKeyPrefix)));
}

std::optional<machine_state_t> reference_store::insert_machine(
    transaction_t& txn,
    machine_state_t machine) const {
  auto index_key = key::make_machine_code_index_key(machine.code);
  if (txn.get_for_update<machine_id_t>(encoder_, index_key)) {
    return std::nullopt;
  }
  machine.machine_id = next_sequence(encoder_, txn, key::kMachineSequence);
  txn.put(encoder_, key::make_machine_key(machine.machine_id), machine);
  txn.put(encoder_, index_key, machine.machine_id);
  return machine;
}

}  // namespace depot::store
