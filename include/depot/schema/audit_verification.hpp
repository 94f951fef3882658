#pragma once
#include <depot/schema/primitives.hpp>
#include <cstdint>
#include <optional>

namespace depot::schema {

/// Result of walking the approval digest chain of one requisition.
struct audit_verification_t final {
  requisition_id_t requisition_id{};
  uint32_t records{};
  bool valid{true};
  /// First record whose id, link or digest does not match.
  std::optional<approval_id_t> first_invalid;
  hash32_t head{};
};

}  // namespace depot::schema
