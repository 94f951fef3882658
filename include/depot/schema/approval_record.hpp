#pragma once
#include <depot/schema/decision.hpp>
#include <depot/schema/primitives.hpp>
#include <string>

// Schema type: approval record.
// Append-only audit entry. digest = blake3(previous_digest || encoded body), so
// the records of one requisition form a chain starting at the zero hash.
namespace depot::schema {

template <uint16_t Version> struct approval_record;

template <> struct approval_record<1> final {
  uint16_t version{1};
  approval_id_t approval_id{};
  requisition_id_t requisition_id{};
  user_id_t approver_id{};
  decision_t decision{decision_t::approve};
  std::string comment;
  timestamp_milliseconds_t decided_at{};
  hash32_t previous_digest{};
  hash32_t digest{};
};

using approval_record_t = approval_record<1>;

}  // namespace depot::schema
