#pragma once
#include <depot/schema/approval_record.hpp>
#include <depot/schema/audit_verification.hpp>
#include <depot/schema/requisition_state.hpp>
#include <depot/store/types.hpp>
#include <string>
#include <vector>

namespace depot::audit {

/// Append-only approval records, one chain per requisition.
class approval_log final {
 public:
  explicit approval_log(depot::store::encoder_t& encoder);

  /// Append the next record of header's chain and bump
  /// header.approvals_count. The caller must hold the requisition row lock
  /// and persist header afterwards.
  depot::schema::approval_record_t append(
      depot::store::transaction_t& txn,
      depot::schema::requisition_state_t& header,
      depot::schema::user_id_t approver_id,
      depot::schema::decision_t decision,
      std::string comment,
      depot::schema::timestamp_milliseconds_t decided_at) const;

  /// Records in append order.
  std::vector<depot::schema::approval_record_t> list(
      depot::store::transaction_t& txn,
      depot::schema::requisition_id_t requisition_id) const;

  depot::schema::audit_verification_t verify(
      depot::store::transaction_t& txn,
      depot::schema::requisition_id_t requisition_id) const;

  /// blake3(previous_digest || SCALE(record with digest zeroed)).
  depot::schema::hash32_t compute_digest(
      const depot::schema::approval_record_t& record) const;

 private:
  depot::store::encoder_t& encoder_;
};

}  // namespace depot::audit
