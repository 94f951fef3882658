#pragma once

#include <depot/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: requisition status.
// Lifecycle: pending -> approved | partially_approved | rejected. cancelled is
// reserved and not produced by any current operation.
namespace depot::schema {

enum class requisition_status_t : uint8_t {
  pending = 0,
  approved = 1,
  partially_approved = 2,
  rejected = 3,
  cancelled = 4
};

inline constexpr auto kRequisitionStatusMappings = std::array{
    std::pair<std::string_view, requisition_status_t>{
        "pending", requisition_status_t::pending},
    std::pair<std::string_view, requisition_status_t>{
        "approved", requisition_status_t::approved},
    std::pair<std::string_view, requisition_status_t>{
        "partially_approved", requisition_status_t::partially_approved},
    std::pair<std::string_view, requisition_status_t>{
        "rejected", requisition_status_t::rejected},
    std::pair<std::string_view, requisition_status_t>{
        "cancelled", requisition_status_t::cancelled}};

template <>
inline std::optional<requisition_status_t>
try_from_string<requisition_status_t>(const std::string_view value) {
  return from_string(value, kRequisitionStatusMappings);
}

inline constexpr std::string_view to_string(const requisition_status_t value) {
  return to_string(value, kRequisitionStatusMappings).value_or("unknown");
}

constexpr bool is_terminal(const requisition_status_t status) {
  switch (status) {
    case requisition_status_t::pending:
      return false;
    case requisition_status_t::approved:
    case requisition_status_t::partially_approved:
    case requisition_status_t::rejected:
    case requisition_status_t::cancelled:
      return true;
  }
  return true;
}

}  // namespace depot::schema
