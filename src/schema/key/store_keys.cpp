#include <depot/schema/key/builder.hpp>
#include <depot/schema/key/store_keys.hpp>

using namespace depot::schema;

namespace depot::schema::key {

namespace {

bytes_t make_id_key(const std::string_view prefix, const uint64_t id) {
  auto b = builder{};
  b.write(prefix);
  b.write(id);
  return b.data;
}

bytes_t make_pair_key(const std::string_view prefix,
                      const uint64_t first,
                      const uint64_t second) {
  auto b = builder{};
  b.write(prefix);
  b.write(first);
  b.write(second);
  return b.data;
}

bytes_t make_name_key(const std::string_view prefix,
                      const std::string_view name) {
  auto b = builder{};
  b.write(prefix);
  b.write(name);
  return b.data;
}

}  // namespace

bytes_t make_prefix(const std::string_view prefix) {
  return make_bytes(prefix);
}

bytes_t make_user_key(const user_id_t user_id) {
  return make_id_key(kUserKeyPrefix, user_id);
}

bytes_t make_area_key(const area_id_t area_id) {
  return make_id_key(kAreaKeyPrefix, area_id);
}

bytes_t make_machine_key(const machine_id_t machine_id) {
  return make_id_key(kMachineKeyPrefix, machine_id);
}

bytes_t make_inventory_key(const inventory_item_id_t inventory_item_id) {
  return make_id_key(kInventoryKeyPrefix, inventory_item_id);
}

bytes_t make_requisition_key(const requisition_id_t requisition_id) {
  return make_id_key(kRequisitionKeyPrefix, requisition_id);
}

bytes_t make_requisition_line_prefix(const requisition_id_t requisition_id) {
  return make_id_key(kRequisitionLineKeyPrefix, requisition_id);
}

bytes_t make_requisition_line_key(
    const requisition_id_t requisition_id,
    const requisition_item_id_t requisition_item_id) {
  return make_pair_key(kRequisitionLineKeyPrefix, requisition_id,
                       requisition_item_id);
}

bytes_t make_approval_prefix(const requisition_id_t requisition_id) {
  return make_id_key(kApprovalKeyPrefix, requisition_id);
}

bytes_t make_approval_key(const requisition_id_t requisition_id,
                          const approval_id_t approval_id) {
  return make_pair_key(kApprovalKeyPrefix, requisition_id, approval_id);
}

bytes_t make_username_index_key(const std::string_view username) {
  return make_name_key(kUsernameIndexPrefix, username);
}

bytes_t make_area_code_index_key(const std::string_view code) {
  return make_name_key(kAreaCodeIndexPrefix, code);
}

bytes_t make_machine_code_index_key(const std::string_view code) {
  return make_name_key(kMachineCodeIndexPrefix, code);
}

bytes_t make_sku_index_key(const std::string_view sku) {
  return make_name_key(kSkuIndexPrefix, sku);
}

bytes_t make_code_index_key(const std::string_view code) {
  return make_name_key(kCodeIndexPrefix, code);
}

bytes_t make_requester_index_prefix(const user_id_t requester_id) {
  return make_id_key(kRequesterIndexPrefix, requester_id);
}

bytes_t make_requester_index_key(const user_id_t requester_id,
                                 const requisition_id_t requisition_id) {
  return make_pair_key(kRequesterIndexPrefix, requester_id, requisition_id);
}

bytes_t make_pending_index_key(const requisition_id_t requisition_id) {
  return make_id_key(kPendingIndexPrefix, requisition_id);
}

bytes_t make_sequence_key(const std::string_view name) {
  return make_name_key(kSequencePrefix, name);
}

bytes_t make_day_sequence_key(const std::string_view yyyymmdd) {
  return make_name_key(kDaySequencePrefix, yyyymmdd);
}

}  // namespace depot::schema::key
