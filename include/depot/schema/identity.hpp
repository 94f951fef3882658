#pragma once
#include <depot/schema/primitives.hpp>
#include <depot/schema/role_id.hpp>
#include <string>

namespace depot::schema {

struct identity_t final {
  user_id_t user_id{};
  std::string username;
  std::string display_name;
  role_id_t role{role_id_t::requester};
};

}  // namespace depot::schema
