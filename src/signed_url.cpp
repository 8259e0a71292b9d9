#include "tessera/signed_url.hpp"

#include <new>

#include "tessera/base64.hpp"
#include "tessera/byte_codec.hpp"
#include "tessera/crypto.hpp"
#include "tessera/logging.hpp"
#include "tessera/secure_vector.hpp"
#include "tessera/time_utils.hpp"

namespace tessera {

namespace {

std::string signingPayload(const SignedUrlParams& params) {
  return params.namespace_ + ":" + params.key + ":" +
         std::to_string(params.expiresAt);
}

}  // namespace

std::string signDownloadUrl(const SignedUrlParams& params,
                            std::string_view secret) {
  const std::string payload = signingPayload(params);
  return base64UrlEncode(HmacSigner(secret).sign(asBytes(payload)));
}

bool verifyDownloadUrl(const SignedUrlParams& params, std::string_view signature,
                       std::string_view secret) noexcept {
  try {
    const std::string expected = signDownloadUrl(params, secret);
    return secure_utils::constantTimeEqual(expected, signature);
  } catch (const TesseraError& e) {
    TESSERA_LOG_ERROR("Download URL verification failed: {}", e.what());
    return false;
  } catch (const std::bad_alloc&) {
    return false;
  }
}

SignedDownloadUrl generateSignedDownloadUrl(std::string_view baseUrl,
                                            std::string_view ns,
                                            std::string_view key,
                                            std::string_view secret,
                                            int64_t expiresInSeconds) {
  return generateSignedDownloadUrl(baseUrl, ns, key, secret, expiresInSeconds,
                                   unixNow());
}

SignedDownloadUrl generateSignedDownloadUrl(std::string_view baseUrl,
                                            std::string_view ns,
                                            std::string_view key,
                                            std::string_view secret,
                                            int64_t expiresInSeconds,
                                            int64_t now) {
  SignedUrlParams params{std::string(ns), std::string(key),
                         addExpirySeconds(now, expiresInSeconds)};
  const std::string signature = signDownloadUrl(params, secret);

  std::string url(baseUrl);
  url += "/blob/f/";
  url += urlEncodeComponent(ns);
  url += '/';
  url += urlEncodeComponent(key);
  url += "?sig=";
  url += signature;
  url += "&exp=";
  url += std::to_string(params.expiresAt);
  return SignedDownloadUrl{std::move(url), params.expiresAt};
}

}  // namespace tessera
