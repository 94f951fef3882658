#pragma once
#include <depot/store/types.hpp>
#include <cstdint>
#include <string_view>

namespace depot::store {

/// Lock the named counter row, advance it and return the new value (first
/// call returns 1). The increment becomes visible only when txn commits.
uint64_t next_sequence(encoder_t& encoder,
                       transaction_t& txn,
                       std::string_view name);

}  // namespace depot::store
