#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Schema type: quantity.
// Stock and requisition quantities as fixed-point thousandths of a unit, so
// ledger arithmetic is exact.
namespace depot::schema {

inline constexpr int64_t kQuantityScale = 1000;

struct quantity_t final {
  int64_t milli_units{};

  constexpr auto operator<=>(const quantity_t&) const = default;
};

constexpr quantity_t make_quantity(const int64_t whole_units) {
  return quantity_t{.milli_units = whole_units * kQuantityScale};
}

constexpr quantity_t operator+(const quantity_t lhs, const quantity_t rhs) {
  return quantity_t{.milli_units = lhs.milli_units + rhs.milli_units};
}

constexpr quantity_t operator-(const quantity_t lhs, const quantity_t rhs) {
  return quantity_t{.milli_units = lhs.milli_units - rhs.milli_units};
}

constexpr bool is_positive(const quantity_t value) {
  return value.milli_units > 0;
}

constexpr bool is_negative(const quantity_t value) {
  return value.milli_units < 0;
}

/// Round to the nearest thousandth; std::nullopt for NaN, infinities and
/// magnitudes outside the representable range.
std::optional<quantity_t> try_quantity_from_double(double value);

double to_double(quantity_t value);

/// Shortest decimal rendering: "8", "2.5", "0.125".
std::string to_string(quantity_t value);

}  // namespace depot::schema
