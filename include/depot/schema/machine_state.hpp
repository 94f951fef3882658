#pragma once
#include <depot/schema/primitives.hpp>
#include <optional>
#include <string>

namespace depot::schema {

template <uint16_t Version> struct machine_state;

template <> struct machine_state<1> final {
  uint16_t version{1};
  machine_id_t machine_id{};
  std::string code;
  std::string name;
  std::optional<area_id_t> area_id;
};

using machine_state_t = machine_state<1>;

}  // namespace depot::schema
