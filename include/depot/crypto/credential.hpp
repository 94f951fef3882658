#pragma once

#include <depot/schema/primitives.hpp>

#include <cstdint>
#include <string_view>

namespace depot::crypto {

inline constexpr uint32_t kDefaultCredentialIterations = 100000;

/// Salted PBKDF2-HMAC-SHA256 credential record:
/// format byte (1) || iterations (u32 big-endian) || salt (16) || key (32).
depot::schema::bytes_t hash_credential(
    std::string_view secret,
    uint32_t iterations = kDefaultCredentialIterations);

/// Constant-time comparison of secret against a stored credential record.
/// Malformed records never verify.
bool verify_credential(std::string_view secret,
                       const depot::schema::bytes_view_t& credential);

}  // namespace depot::crypto
