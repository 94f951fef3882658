#pragma once

#include <depot/schema/primitives.hpp>
#include <depot/schema/quantity.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace depot::testing {

// 2025-03-14T12:00:00Z
inline constexpr depot::schema::timestamp_milliseconds_t kFixedNow =
    1741953600000;

inline depot::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = depot::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline depot::schema::quantity_t units(const int64_t whole) {
  return depot::schema::make_quantity(whole);
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace depot::testing
