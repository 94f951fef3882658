#include <depot/common/critical.hpp>
#include <depot/crypto/credential.hpp>

#include <boost/endian/conversion.hpp>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <array>
#include <cstring>
#include <limits>

namespace depot::crypto {

namespace {

constexpr uint8_t kCredentialFormat = 1;
constexpr std::size_t kSaltSize = 16;
constexpr std::size_t kKeySize = 32;
constexpr std::size_t kHeaderSize = 1 + sizeof(uint32_t);
constexpr std::size_t kCredentialSize = kHeaderSize + kSaltSize + kKeySize;

using key_t = std::array<uint8_t, kKeySize>;

bool derive_key(const std::string_view secret,
                const uint8_t* salt,
                const uint32_t iterations,
                key_t& out) {
  if (iterations == 0 ||
      iterations > static_cast<uint32_t>(std::numeric_limits<int>::max()) ||
      secret.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    return false;
  }
  return PKCS5_PBKDF2_HMAC(secret.data(), static_cast<int>(secret.size()), salt,
                           static_cast<int>(kSaltSize),
                           static_cast<int>(iterations), EVP_sha256(),
                           static_cast<int>(out.size()), out.data()) == 1;
}

}  // namespace

depot::schema::bytes_t hash_credential(const std::string_view secret,
                                       const uint32_t iterations) {
  auto salt = std::array<uint8_t, kSaltSize>{};
  if (RAND_bytes(salt.data(), static_cast<int>(salt.size())) != 1) {
    depot::common::critical("OpenSSL RAND_bytes failed");
  }
  auto key = key_t{};
  if (!derive_key(secret, salt.data(), iterations, key)) {
    depot::common::critical("OpenSSL PBKDF2 derivation failed");
  }

  auto out = depot::schema::bytes_t{};
  out.reserve(kCredentialSize);
  out.push_back(kCredentialFormat);
  auto big = boost::endian::native_to_big(iterations);
  auto raw = reinterpret_cast<const uint8_t*>(&big);
  out.insert(std::end(out), raw, raw + sizeof(big));
  out.insert(std::end(out), std::begin(salt), std::end(salt));
  out.insert(std::end(out), std::begin(key), std::end(key));
  return out;
}

bool verify_credential(const std::string_view secret,
                       const depot::schema::bytes_view_t& credential) {
  if (credential.size() != kCredentialSize ||
      credential[0] != kCredentialFormat) {
    return false;
  }
  auto big = uint32_t{};
  std::memcpy(&big, credential.data() + 1, sizeof(big));
  auto iterations = boost::endian::big_to_native(big);

  auto key = key_t{};
  if (!derive_key(secret, credential.data() + kHeaderSize, iterations, key)) {
    return false;
  }
  return CRYPTO_memcmp(key.data(), credential.data() + kHeaderSize + kSaltSize,
                       key.size()) == 0;
}

}  // namespace depot::crypto
