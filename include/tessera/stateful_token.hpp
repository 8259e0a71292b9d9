/**
 * @file stateful_token.hpp
 * @brief Opaque, revocable, single-use tokens backed by a key-value record
 *
 * Unlike resource tokens these carry no signature: the id is a random
 * handle and validity lives entirely in the stored record.
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "config.hpp"
#include "credential.hpp"
#include "identity.hpp"
#include "kv_store.hpp"
#include "time_utils.hpp"

namespace tessera {

enum class TokenAction { IdentityClaim, BlobAccess, ChannelAccess };

std::string_view tokenActionToString(TokenAction action) noexcept;
std::optional<TokenAction> tokenActionFromString(std::string_view text);

struct IdentityClaimPayload {
  std::string identityId;
};

struct BlobAccessPayload {
  std::string namespace_;
  std::string blobKey;
  std::vector<std::string> permissions;
};

struct ChannelAccessPayload {
  std::string channelId;
  std::vector<std::string> permissions;
};

/// Alternative order follows TokenAction
using TokenPayload =
    std::variant<IdentityClaimPayload, BlobAccessPayload, ChannelAccessPayload>;

struct StatefulToken {
  std::string id;  ///< tk_<32 hex>
  Timestamp createdAt;
  Timestamp expiresAt;
  std::string createdBy;
  std::optional<std::string> label;
  std::optional<Timestamp> usedAt;
  std::optional<std::string> usedBy;
  bool revoked = false;
  std::optional<Timestamp> revokedAt;
  std::optional<std::string> revokedReason;
  TokenPayload payload;

  TokenAction action() const noexcept {
    return static_cast<TokenAction>(payload.index());
  }
};

constexpr int64_t DEFAULT_STATEFUL_TOKEN_TTL_SECONDS = 7 * 24 * 3600;

struct IdentityClaimTokenParams {
  std::string identityId;
  std::string createdBy;
  std::optional<std::string> label;
  std::optional<int64_t> expiresInSeconds;
};

struct BlobAccessTokenParams {
  std::string namespace_;
  std::string blobKey;
  std::vector<std::string> permissions;
  std::string createdBy;
  std::optional<std::string> label;
  std::optional<int64_t> expiresInSeconds;
};

struct ChannelAccessTokenParams {
  std::string channelId;
  std::vector<std::string> permissions;
  std::string createdBy;
  std::optional<std::string> label;
  std::optional<int64_t> expiresInSeconds;
};

std::string generateTokenId();
std::string getTokenKvKey(std::string_view tokenId);

/**
 * @brief "tk_" followed by 32 characters
 */
bool isValidTokenId(std::string_view tokenId) noexcept;

/**
 * @brief Build a fresh token record
 *
 * Lifetime defaults to seven days when expiresInSeconds is not given.
 * @throws ExpiryOutOfRangeError if the lifetime overflows the clock
 */
StatefulToken createIdentityClaimToken(const IdentityClaimTokenParams& params);
StatefulToken createBlobAccessToken(const BlobAccessTokenParams& params);
StatefulToken createChannelAccessToken(const ChannelAccessTokenParams& params);

bool isTokenExpired(const StatefulToken& token);
bool isTokenExpired(const StatefulToken& token, Timestamp now);
bool isTokenRevoked(const StatefulToken& token) noexcept;
bool isTokenUsed(const StatefulToken& token) noexcept;
bool isTokenValid(const StatefulToken& token);
bool isTokenValid(const StatefulToken& token, Timestamp now);

/**
 * @brief Human-readable reason for the first failing check, if any
 */
std::optional<std::string> getTokenInvalidReason(const StatefulToken& token);
std::optional<std::string> getTokenInvalidReason(const StatefulToken& token,
                                                 Timestamp now);

StatefulToken markTokenUsed(const StatefulToken& token, std::string usedBy);
StatefulToken revokeToken(const StatefulToken& token,
                          std::optional<std::string> reason = std::nullopt);

std::string serializeToken(const StatefulToken& token);

/**
 * @brief nullopt on malformed JSON or missing id, action, createdAt or
 *        expiresAt
 */
std::optional<StatefulToken> deserializeToken(std::string_view json);

/**
 * @brief {base}/claim?token=<id>&gateway=<urlencoded gateway>
 *
 * base falls back to the gateway URL when empty.
 */
std::string buildTokenShareUrl(std::string_view tokenId,
                               std::string_view gatewayUrl,
                               std::string_view baseUrl = {});

/**
 * @brief {baseUrl}#<id>@<base64 gateway>
 */
std::string buildCompactTokenShareUrl(std::string_view tokenId,
                                      std::string_view gatewayUrl,
                                      std::string_view baseUrl);

struct CompactShareTarget {
  std::string tokenId;
  std::string gatewayUrl;
};

std::optional<CompactShareTarget> parseCompactTokenShareUrl(
    std::string_view url);

struct TokenLookupResult {
  bool valid = false;
  std::optional<StatefulToken> token;
  std::optional<std::string> error;
};

struct ClaimIdentityResult {
  bool success = false;
  std::optional<Identity> identity;
  std::optional<Credential> credential;
  std::optional<std::string> secret;  ///< plaintext, shown once
  std::optional<std::string> error;
};

/**
 * @brief Persists stateful tokens through an injected key-value store
 *
 * Store exceptions propagate unchanged. The store is borrowed and must
 * outlive this object.
 */
class StatefulTokenStore {
 public:
  explicit StatefulTokenStore(KeyValueStore& kv, AuthConfig config = {});

  StatefulToken issueIdentityClaimToken(IdentityClaimTokenParams params);
  StatefulToken issueBlobAccessToken(BlobAccessTokenParams params);
  StatefulToken issueChannelAccessToken(ChannelAccessTokenParams params);

  void save(const StatefulToken& token);

  /**
   * @brief Raw load; nullopt if absent or unreadable
   */
  std::optional<StatefulToken> load(std::string_view tokenId);

  /**
   * @brief Load and validate, reporting why a token cannot be used
   */
  TokenLookupResult lookup(std::string_view tokenId);

  /**
   * @brief Revoke a stored token; the error text explains a refusal
   */
  TokenLookupResult revoke(std::string_view tokenId,
                           std::optional<std::string> reason = std::nullopt);

  /**
   * @brief Redeem an identity-claim token
   *
   * Activates the pending identity, creates its first API key and marks the
   * token used by that identity. All records are written back.
   */
  ClaimIdentityResult claimIdentity(std::string_view tokenId);

  const AuthConfig& config() const noexcept { return config_; }

 private:
  int64_t ttl(const std::optional<int64_t>& requested) const;

  KeyValueStore& kv_;
  AuthConfig config_;
};

}  // namespace tessera
