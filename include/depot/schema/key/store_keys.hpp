#pragma once

#include <depot/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema key type: store keys.
// Canonical key prefixes for depot state rows, secondary indexes and id
// sequences. Ids follow the prefix as big-endian u64 values.
namespace depot::schema::key {

inline constexpr std::string_view kUserKeyPrefix{"DEPOT|STATE|USER|"};
inline constexpr std::string_view kAreaKeyPrefix{"DEPOT|STATE|AREA|"};
inline constexpr std::string_view kMachineKeyPrefix{"DEPOT|STATE|MACHINE|"};
inline constexpr std::string_view kInventoryKeyPrefix{"DEPOT|STATE|INVENTORY|"};
inline constexpr std::string_view kRequisitionKeyPrefix{
    "DEPOT|STATE|REQUISITION|"};
inline constexpr std::string_view kRequisitionLineKeyPrefix{
    "DEPOT|STATE|REQUISITION_LINE|"};
inline constexpr std::string_view kApprovalKeyPrefix{"DEPOT|STATE|APPROVAL|"};

inline constexpr std::string_view kUsernameIndexPrefix{
    "DEPOT|INDEX|USERNAME|"};
inline constexpr std::string_view kAreaCodeIndexPrefix{
    "DEPOT|INDEX|AREA_CODE|"};
inline constexpr std::string_view kMachineCodeIndexPrefix{
    "DEPOT|INDEX|MACHINE_CODE|"};
inline constexpr std::string_view kSkuIndexPrefix{"DEPOT|INDEX|SKU|"};
inline constexpr std::string_view kCodeIndexPrefix{"DEPOT|INDEX|CODE|"};
inline constexpr std::string_view kRequesterIndexPrefix{
    "DEPOT|INDEX|REQUESTER|"};
inline constexpr std::string_view kPendingIndexPrefix{"DEPOT|INDEX|PENDING|"};

inline constexpr std::string_view kSequencePrefix{"DEPOT|SEQ|"};
inline constexpr std::string_view kDaySequencePrefix{"DEPOT|SEQ|DAY|"};

inline constexpr std::string_view kUserSequence{"USER"};
inline constexpr std::string_view kAreaSequence{"AREA"};
inline constexpr std::string_view kMachineSequence{"MACHINE"};
inline constexpr std::string_view kInventorySequence{"INVENTORY"};
inline constexpr std::string_view kRequisitionSequence{"REQUISITION"};
inline constexpr std::string_view kRequisitionLineSequence{"REQUISITION_LINE"};

inline const std::array<std::string_view, 15> kStoreKeyspaces{
    kUserKeyPrefix,          kAreaKeyPrefix,
    kMachineKeyPrefix,       kInventoryKeyPrefix,
    kRequisitionKeyPrefix,   kRequisitionLineKeyPrefix,
    kApprovalKeyPrefix,      kUsernameIndexPrefix,
    kAreaCodeIndexPrefix,    kMachineCodeIndexPrefix,
    kSkuIndexPrefix,         kCodeIndexPrefix,
    kRequesterIndexPrefix,   kPendingIndexPrefix,
    kSequencePrefix};

depot::schema::bytes_t make_prefix(std::string_view prefix);

depot::schema::bytes_t make_user_key(depot::schema::user_id_t user_id);
depot::schema::bytes_t make_area_key(depot::schema::area_id_t area_id);
depot::schema::bytes_t make_machine_key(
    depot::schema::machine_id_t machine_id);
depot::schema::bytes_t make_inventory_key(
    depot::schema::inventory_item_id_t inventory_item_id);
depot::schema::bytes_t make_requisition_key(
    depot::schema::requisition_id_t requisition_id);

depot::schema::bytes_t make_requisition_line_prefix(
    depot::schema::requisition_id_t requisition_id);
depot::schema::bytes_t make_requisition_line_key(
    depot::schema::requisition_id_t requisition_id,
    depot::schema::requisition_item_id_t requisition_item_id);

depot::schema::bytes_t make_approval_prefix(
    depot::schema::requisition_id_t requisition_id);
depot::schema::bytes_t make_approval_key(
    depot::schema::requisition_id_t requisition_id,
    depot::schema::approval_id_t approval_id);

depot::schema::bytes_t make_username_index_key(std::string_view username);
depot::schema::bytes_t make_area_code_index_key(std::string_view code);
depot::schema::bytes_t make_machine_code_index_key(std::string_view code);
depot::schema::bytes_t make_sku_index_key(std::string_view sku);
depot::schema::bytes_t make_code_index_key(std::string_view code);

depot::schema::bytes_t make_requester_index_prefix(
    depot::schema::user_id_t requester_id);
depot::schema::bytes_t make_requester_index_key(
    depot::schema::user_id_t requester_id,
    depot::schema::requisition_id_t requisition_id);

depot::schema::bytes_t make_pending_index_key(
    depot::schema::requisition_id_t requisition_id);

depot::schema::bytes_t make_sequence_key(std::string_view name);
depot::schema::bytes_t make_day_sequence_key(std::string_view yyyymmdd);

}  // namespace depot::schema::key
