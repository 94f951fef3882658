#pragma once

#include <cstdint>
#include <string_view>

namespace depot::schema {

enum class error_code : uint32_t {
  ok = 0,
  // validation
  empty_requisition = 1,
  unknown_inventory_item = 2,
  unknown_requester = 3,
  unknown_approver = 4,
  unknown_machine = 5,
  unknown_area = 6,
  unknown_requisition_item = 7,
  invalid_approved_quantity = 8,
  invalid_quantity = 9,
  invalid_argument = 10,
  // state
  invalid_state_transition = 20,
  // not found
  requisition_missing = 30,
  unknown_user = 31,
  // conflicts
  user_exists = 40,
  area_exists = 41,
  machine_exists = 42,
  sku_exists = 43,
  // authorization
  authorization_denied = 50,
  invalid_credentials = 51,
  // infrastructure
  storage_failure = 60,
  code_generation_failed = 61,
};

enum class error_category : uint8_t {
  none,
  validation,
  state_conflict,
  not_found,
  conflict,
  authorization,
  storage,
  code_generation
};

constexpr error_category category_of(const error_code code) {
  switch (code) {
    case error_code::ok:
      return error_category::none;
    case error_code::empty_requisition:
    case error_code::unknown_inventory_item:
    case error_code::unknown_requester:
    case error_code::unknown_approver:
    case error_code::unknown_machine:
    case error_code::unknown_area:
    case error_code::unknown_requisition_item:
    case error_code::invalid_approved_quantity:
    case error_code::invalid_quantity:
    case error_code::invalid_argument:
      return error_category::validation;
    case error_code::invalid_state_transition:
      return error_category::state_conflict;
    case error_code::requisition_missing:
    case error_code::unknown_user:
      return error_category::not_found;
    case error_code::user_exists:
    case error_code::area_exists:
    case error_code::machine_exists:
    case error_code::sku_exists:
      return error_category::conflict;
    case error_code::authorization_denied:
    case error_code::invalid_credentials:
      return error_category::authorization;
    case error_code::storage_failure:
      return error_category::storage;
    case error_code::code_generation_failed:
      return error_category::code_generation;
  }
  return error_category::none;
}

/// Storage conflicts and code exhaustion may succeed when retried later.
constexpr bool is_retryable(const error_code code) {
  return code == error_code::storage_failure ||
         code == error_code::code_generation_failed;
}

constexpr std::string_view to_string(const error_code code) {
  switch (code) {
    case error_code::ok:
      return "ok";
    case error_code::empty_requisition:
      return "empty requisition";
    case error_code::unknown_inventory_item:
      return "unknown inventory item";
    case error_code::unknown_requester:
      return "unknown requester";
    case error_code::unknown_approver:
      return "unknown approver";
    case error_code::unknown_machine:
      return "unknown machine";
    case error_code::unknown_area:
      return "unknown area";
    case error_code::unknown_requisition_item:
      return "unknown requisition item";
    case error_code::invalid_approved_quantity:
      return "invalid approved quantity";
    case error_code::invalid_quantity:
      return "invalid quantity";
    case error_code::invalid_argument:
      return "invalid argument";
    case error_code::invalid_state_transition:
      return "invalid state transition";
    case error_code::requisition_missing:
      return "requisition missing";
    case error_code::unknown_user:
      return "unknown user";
    case error_code::user_exists:
      return "user exists";
    case error_code::area_exists:
      return "area exists";
    case error_code::machine_exists:
      return "machine exists";
    case error_code::sku_exists:
      return "sku exists";
    case error_code::authorization_denied:
      return "authorization denied";
    case error_code::invalid_credentials:
      return "invalid credentials";
    case error_code::storage_failure:
      return "storage failure";
    case error_code::code_generation_failed:
      return "code generation failed";
  }
  return "unknown";
}

}  // namespace depot::schema
