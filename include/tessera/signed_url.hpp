/**
 * @file signed_url.hpp
 * @brief Presigned blob download URLs
 *
 * The signature is base64url(HMAC-SHA256(secret, "<namespace>:<key>:<exp>"))
 * with the full 32-byte MAC.
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace tessera {

struct SignedUrlParams {
  std::string namespace_;
  std::string key;
  int64_t expiresAt = 0;  ///< unix seconds
};

struct SignedDownloadUrl {
  std::string url;
  int64_t expiresAt = 0;
};

constexpr int64_t DEFAULT_DOWNLOAD_URL_TTL_SECONDS = 3600;

std::string signDownloadUrl(const SignedUrlParams& params,
                            std::string_view secret);

/**
 * @brief Constant-time signature check
 *
 * Only the signature is checked; comparing expiresAt against the clock is
 * left to the caller that parsed it from the URL.
 */
bool verifyDownloadUrl(const SignedUrlParams& params, std::string_view signature,
                       std::string_view secret) noexcept;

/**
 * @brief {baseUrl}/blob/f/{namespace}/{key}?sig={sig}&exp={expiresAt}
 *
 * Namespace and key are percent-encoded.
 * @throws ExpiryOutOfRangeError if now + expiresInSeconds overflows
 */
SignedDownloadUrl generateSignedDownloadUrl(
    std::string_view baseUrl, std::string_view ns, std::string_view key,
    std::string_view secret,
    int64_t expiresInSeconds = DEFAULT_DOWNLOAD_URL_TTL_SECONDS);
SignedDownloadUrl generateSignedDownloadUrl(std::string_view baseUrl,
                                            std::string_view ns,
                                            std::string_view key,
                                            std::string_view secret,
                                            int64_t expiresInSeconds,
                                            int64_t now);

}  // namespace tessera
