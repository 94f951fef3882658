#pragma once
#include <depot/schema/primitives.hpp>
#include <depot/schema/requisition_status.hpp>
#include <optional>
#include <string>

// Schema type: requisition state.
// Header row of a requisition. Lines and approvals are stored under their own
// keys; approvals_count is the last issued approval id.
namespace depot::schema {

template <uint16_t Version> struct requisition_state;

template <> struct requisition_state<1> final {
  uint16_t version{1};
  requisition_id_t requisition_id{};
  std::string code;
  user_id_t requester_id{};
  std::optional<machine_id_t> machine_id;
  std::optional<area_id_t> area_id;
  requisition_status_t status{requisition_status_t::pending};
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t updated_at{};
  std::string note;
  uint32_t approvals_count{};
};

using requisition_state_t = requisition_state<1>;

}  // namespace depot::schema
