#pragma once
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace depot::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using timestamp_milliseconds_t = uint64_t;

using user_id_t = uint64_t;
using area_id_t = uint64_t;
using machine_id_t = uint64_t;
using inventory_item_id_t = uint64_t;
using requisition_id_t = uint64_t;
using requisition_item_id_t = uint64_t;
using approval_id_t = uint64_t;

bytes_t make_bytes(const std::string_view& bytes);
std::string make_string(const bytes_view_t& bytes);

std::string to_hex(const bytes_view_t& bytes);

hash32_t make_zero_hash();

}  // namespace depot::schema
