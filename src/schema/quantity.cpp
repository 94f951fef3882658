#include <depot/schema/quantity.hpp>

#include <cmath>

namespace depot::schema {

std::optional<quantity_t> try_quantity_from_double(const double value) {
  if (!std::isfinite(value)) {
    return std::nullopt;
  }
  const auto scaled = std::round(value * static_cast<double>(kQuantityScale));
  // 2^63 is exactly representable; anything at or beyond it overflows.
  constexpr auto kLimit = 9.223372036854775807e18;
  if (scaled >= kLimit || scaled <= -kLimit) {
    return std::nullopt;
  }
  return quantity_t{.milli_units = static_cast<int64_t>(scaled)};
}

double to_double(const quantity_t value) {
  return static_cast<double>(value.milli_units) /
         static_cast<double>(kQuantityScale);
}

std::string to_string(const quantity_t value) {
  auto magnitude = value.milli_units;
  auto out = std::string{};
  if (magnitude < 0) {
    out.push_back('-');
    magnitude = -magnitude;
  }
  out += std::to_string(magnitude / kQuantityScale);
  auto fraction = magnitude % kQuantityScale;
  if (fraction == 0) {
    return out;
  }
  auto digits = std::to_string(fraction);
  digits.insert(0, 3 - digits.size(), '0');
  while (!digits.empty() && digits.back() == '0') {
    digits.pop_back();
  }
  out.push_back('.');
  out += digits;
  return out;
}

}  // namespace depot::schema
