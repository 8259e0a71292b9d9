#include "tessera/crypto.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <algorithm>
#include <new>

#include "tessera/byte_codec.hpp"
#include "tessera/logging.hpp"

namespace tessera {

Hmac256 HmacSigner::sign(std::span<const uint8_t> data) const {
  static const unsigned char empty_key = 0;
  const unsigned char* key = key_.empty() ? &empty_key : key_.data();

  // Intermediate MAC buffer lives in locked memory until copied out
  SecureVector<uint8_t> secure_result(EVP_MAX_MD_SIZE);
  unsigned int len = 0;

  if (!HMAC(EVP_sha256(), key, static_cast<int>(key_.size()), data.data(),
            data.size(), secure_result.data(), &len) ||
      len != crypto_constants::HMAC_SHA256_SIZE) {
    TESSERA_LOG_ERROR("HMAC-SHA256 failed: OpenSSL error {}", ERR_get_error());
    throw CryptoError("HMAC signing failed");
  }

  Hmac256 mac{};
  std::copy_n(secure_result.begin(), mac.size(), mac.begin());
  return mac;
}

std::vector<uint8_t> HmacSigner::signTruncated(std::span<const uint8_t> data,
                                               size_t length) const {
  if (length == 0 || length > crypto_constants::HMAC_SHA256_SIZE) {
    throw InvalidArgumentError("Signature length must be 1..32 bytes");
  }
  auto mac = sign(data);
  return std::vector<uint8_t>(mac.begin(), mac.begin() + length);
}

bool HmacSigner::verifyTruncated(
    std::span<const uint8_t> data,
    std::span<const uint8_t> signature) const noexcept {
  if (signature.empty() ||
      signature.size() > crypto_constants::HMAC_SHA256_SIZE) {
    return false;
  }
  try {
    auto mac = sign(data);
    return secure_utils::constantTimeEqual(
        std::span<const uint8_t>(mac.data(), signature.size()), signature);
  } catch (const TesseraError&) {
    return false;
  } catch (const std::bad_alloc&) {
    return false;
  }
}

std::array<uint8_t, crypto_constants::SHA256_SIZE> hashSha256(
    std::span<const uint8_t> data) {
  std::array<uint8_t, crypto_constants::SHA256_SIZE> hash{};
  if (!SHA256(data.data(), data.size(), hash.data())) {
    throw CryptoError("SHA-256 failed");
  }
  return hash;
}

std::string sha256Hex(std::string_view text) {
  return hexEncode(hashSha256(asBytes(text)));
}

std::vector<uint8_t> randomBytes(size_t count) {
  std::vector<uint8_t> bytes(count);
  if (count == 0) return bytes;
  if (RAND_bytes(bytes.data(), static_cast<int>(count)) != 1) {
    TESSERA_LOG_ERROR("RAND_bytes failed for {} bytes", count);
    unsigned long err = ERR_get_error();
    if (err == 0) {
      throwOsError("RAND_bytes");
    } else {
      throw CryptoError("Failed to generate random bytes: OpenSSL error " +
                        std::to_string(err));
    }
  }
  return bytes;
}

std::string randomHex(size_t byteCount) {
  return hexEncode(randomBytes(byteCount));
}

}  // namespace tessera
