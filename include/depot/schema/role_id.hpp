#pragma once

#include <depot/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: role id.
// The three fixed roles: requesters submit, approvers decide, administrators
// do both and manage users and reference data.
namespace depot::schema {

enum class role_id_t : uint8_t {
  requester = 0,
  approver = 1,
  administrator = 2
};

inline constexpr auto kRoleIdMappings = std::array{
    std::pair<std::string_view, role_id_t>{"requester", role_id_t::requester},
    std::pair<std::string_view, role_id_t>{"approver", role_id_t::approver},
    std::pair<std::string_view, role_id_t>{"administrator",
                                           role_id_t::administrator},
};

template <>
inline std::optional<role_id_t> try_from_string<role_id_t>(
    const std::string_view value) {
  return from_string(value, kRoleIdMappings);
}

inline constexpr std::string_view to_string(const role_id_t value) {
  return to_string(value, kRoleIdMappings).value_or("unknown");
}

constexpr bool can_submit(const role_id_t role) {
  switch (role) {
    case role_id_t::requester:
    case role_id_t::administrator:
      return true;
    case role_id_t::approver:
      return false;
  }
  return false;
}

constexpr bool can_decide(const role_id_t role) {
  switch (role) {
    case role_id_t::approver:
    case role_id_t::administrator:
      return true;
    case role_id_t::requester:
      return false;
  }
  return false;
}

constexpr bool can_administer(const role_id_t role) {
  switch (role) {
    case role_id_t::administrator:
      return true;
    case role_id_t::requester:
    case role_id_t::approver:
      return false;
  }
  return false;
}

}  // namespace depot::schema
