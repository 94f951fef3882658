#pragma once

#include <depot/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace depot::schema {

enum class decision_t : uint8_t { approve = 0, reject = 1 };

inline constexpr auto kDecisionMappings = std::array{
    std::pair<std::string_view, decision_t>{"approve", decision_t::approve},
    std::pair<std::string_view, decision_t>{"reject", decision_t::reject}};

template <>
inline std::optional<decision_t> try_from_string<decision_t>(
    const std::string_view value) {
  return from_string(value, kDecisionMappings);
}

inline constexpr std::string_view to_string(const decision_t value) {
  return to_string(value, kDecisionMappings).value_or("unknown");
}

}  // namespace depot::schema
