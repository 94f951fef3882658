#pragma once
#include <depot/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace depot::blake3 {

depot::schema::hash32_t hash(const std::string_view& str);
depot::schema::hash32_t hash(const depot::schema::bytes_view_t& bytes);

/// blake3(previous || bytes), the link function of the approval audit chain.
depot::schema::hash32_t chain(const depot::schema::hash32_t& previous,
                              const depot::schema::bytes_view_t& bytes);

}  // namespace depot::blake3
