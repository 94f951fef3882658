#include <depot/audit/approval_log.hpp>
#include <depot/blake3/hash.hpp>
#include <depot/common/critical.hpp>
#include <depot/schema/key/store_keys.hpp>

using namespace depot::schema;
namespace key = depot::schema::key;

namespace depot::audit {

approval_log::approval_log(depot::store::encoder_t& encoder)
    : encoder_{encoder} {}

approval_record_t approval_log::append(depot::store::transaction_t& txn,
                                       requisition_state_t& header,
                                       const user_id_t approver_id,
                                       const decision_t decision,
                                       std::string comment,
                                       const timestamp_milliseconds_t decided_at)
    const {
  auto previous = make_zero_hash();
  if (header.approvals_count > 0) {
    auto last = txn.get<approval_record_t>(
        encoder_,
        key::make_approval_key(header.requisition_id, header.approvals_count));
    if (!last) {
      depot::common::critical("approval chain is missing its last record");
    }
    previous = last->digest;
  }

  auto record = approval_record_t{};
  record.approval_id = header.approvals_count + 1;
  record.requisition_id = header.requisition_id;
  record.approver_id = approver_id;
  record.decision = decision;
  record.comment = std::move(comment);
  record.decided_at = decided_at;
  record.previous_digest = previous;
  record.digest = compute_digest(record);

  txn.put(encoder_,
          key::make_approval_key(record.requisition_id, record.approval_id),
          record);
  header.approvals_count = static_cast<uint32_t>(record.approval_id);
  return record;
}

std::vector<approval_record_t> approval_log::list(
    depot::store::transaction_t& txn,
    const requisition_id_t requisition_id) const {
  return depot::store::decode_values<approval_record_t>(
      encoder_, txn.list_by_prefix(key::make_approval_prefix(requisition_id)));
}

audit_verification_t approval_log::verify(
    depot::store::transaction_t& txn,
    const requisition_id_t requisition_id) const {
  auto result = audit_verification_t{};
  result.requisition_id = requisition_id;
  result.head = make_zero_hash();

  auto expected_id = approval_id_t{1};
  for (const auto& record : list(txn, requisition_id)) {
    ++result.records;
    auto ok = record.approval_id == expected_id &&
              record.requisition_id == requisition_id &&
              record.previous_digest == result.head &&
              record.digest == compute_digest(record);
    if (!ok && result.valid) {
      result.valid = false;
      result.first_invalid = record.approval_id;
      spdlog::warn(
          "approval chain of requisition {} broken at record {} (digest {})",
          requisition_id, record.approval_id,
          depot::schema::to_hex(depot::schema::bytes_view_t{
              record.digest.data(), record.digest.size()}));
    }
    result.head = record.digest;
    ++expected_id;
  }
  return result;
}

hash32_t approval_log::compute_digest(const approval_record_t& record) const {
  auto body = record;
  body.digest = make_zero_hash();
  auto encoded = encoder_.encode(body);
  return depot::blake3::chain(record.previous_digest, encoded);
}

}  // namespace depot::audit
