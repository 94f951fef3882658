#pragma once
#include <depot/schema/primitives.hpp>
#include <string>

namespace depot::schema {

template <uint16_t Version> struct area_state;

template <> struct area_state<1> final {
  uint16_t version{1};
  area_id_t area_id{};
  std::string code;
  std::string name;
};

using area_state_t = area_state<1>;

}  // namespace depot::schema
