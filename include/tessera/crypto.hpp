/**
 * @file crypto.hpp
 * @brief HMAC-SHA256 signing, SHA-256 hashing and OpenSSL randomness
 */

#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "error.hpp"
#include "secure_vector.hpp"

namespace tessera {

namespace crypto_constants {
constexpr size_t HMAC_SHA256_SIZE = 32;  ///< Full HMAC-SHA256 output
constexpr size_t SHA256_SIZE = 32;
}  // namespace crypto_constants

using Hmac256 = std::array<uint8_t, crypto_constants::HMAC_SHA256_SIZE>;

/**
 * @brief HMAC-SHA256 keyed with a resource or gateway secret
 *
 * Secrets are arbitrary byte strings (UTF-8 text in practice); no minimum
 * length is imposed since per-resource secrets are minted elsewhere.
 */
class HmacSigner {
 public:
  explicit HmacSigner(std::string_view secret)
      : key_(secret.begin(), secret.end()) {}

  explicit HmacSigner(SecureVector<uint8_t> key) : key_(std::move(key)) {}

  /**
   * @brief Compute the full 32-byte MAC
   * @throws CryptoError if OpenSSL fails
   */
  Hmac256 sign(std::span<const uint8_t> data) const;

  /**
   * @brief First @p length bytes of the MAC
   * @throws InvalidArgumentError if length is 0 or above 32
   */
  std::vector<uint8_t> signTruncated(std::span<const uint8_t> data,
                                     size_t length) const;

  /**
   * @brief Check a (possibly truncated) signature in constant time
   *
   * The signature length selects the truncation. Empty or oversize
   * signatures are rejected; never throws.
   */
  bool verifyTruncated(std::span<const uint8_t> data,
                       std::span<const uint8_t> signature) const noexcept;

 private:
  SecureVector<uint8_t> key_;
};

/**
 * @brief SHA-256 digest
 */
std::array<uint8_t, crypto_constants::SHA256_SIZE> hashSha256(
    std::span<const uint8_t> data);

/**
 * @brief Lowercase hex SHA-256 of UTF-8 text
 */
std::string sha256Hex(std::string_view text);

/**
 * @brief Cryptographically secure random bytes from RAND_bytes
 * @throws CryptoError or an OS error (via throwOsError) if the RNG fails
 */
std::vector<uint8_t> randomBytes(size_t count);

/**
 * @brief @p byteCount random bytes rendered as 2*byteCount hex chars
 */
std::string randomHex(size_t byteCount);

}  // namespace tessera
