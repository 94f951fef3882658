#pragma once

#include <depot/schema/error_code.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace depot::schema {

inline constexpr std::string_view kCodespaceSubmit = "depot.submit";
inline constexpr std::string_view kCodespaceDecide = "depot.decide";
inline constexpr std::string_view kCodespaceQuery = "depot.query";
inline constexpr std::string_view kCodespaceAdmin = "depot.admin";
inline constexpr std::string_view kCodespaceAuth = "depot.auth";

template <typename T>
struct operation_result final {
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  std::optional<T> value;

  bool ok() const { return code == 0; }
  error_code error() const { return static_cast<error_code>(code); }
};

template <typename T>
operation_result<T> make_success(T value, const std::string_view codespace) {
  auto result = operation_result<T>{};
  result.codespace = std::string{codespace};
  result.value = std::move(value);
  return result;
}

template <typename T>
operation_result<T> make_error(const error_code code,
                               const std::string_view codespace,
                               std::string info) {
  auto result = operation_result<T>{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{to_string(code)};
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

}  // namespace depot::schema
