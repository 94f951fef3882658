#pragma once
#include <depot/schema/primitives.hpp>
#include <depot/schema/role_id.hpp>
#include <string>

namespace depot::schema {

template <uint16_t Version> struct user_state;

template <> struct user_state<1> final {
  uint16_t version{1};
  user_id_t user_id{};
  std::string username;
  std::string display_name;
  bytes_t credential;
  role_id_t role{role_id_t::requester};
  timestamp_milliseconds_t created_at{};
};

using user_state_t = user_state<1>;

}  // namespace depot::schema
