#include "tessera/stateful_token.hpp"

#include <array>

#include "tessera/base64.hpp"
#include "tessera/byte_codec.hpp"
#include "tessera/crypto.hpp"
#include "tessera/error.hpp"
#include "tessera/json_serialization.hpp"
#include "tessera/logging.hpp"

namespace tessera {

namespace {

constexpr std::string_view TOKEN_PREFIX = "tk_";
constexpr std::string_view TOKEN_KEY_PREFIX = "__TOKEN:";
constexpr size_t TOKEN_ID_LENGTH = 35;

constexpr std::array<std::string_view, 3> action_names{
    "identity:claim", "blob:access", "channel:access"};

StatefulToken stamp(std::string createdBy, std::optional<std::string> label,
                    int64_t expiresInSeconds, TokenPayload payload) {
  StatefulToken token;
  token.id = generateTokenId();
  token.createdAt = Clock::now();
  token.expiresAt = addExpiry(token.createdAt, expiresInSeconds);
  token.createdBy = std::move(createdBy);
  token.label = std::move(label);
  token.payload = std::move(payload);
  return token;
}

TokenLookupResult failure(std::string error) {
  return TokenLookupResult{false, std::nullopt, std::move(error)};
}

ClaimIdentityResult claimFailure(std::string error) {
  ClaimIdentityResult result;
  result.error = std::move(error);
  return result;
}

}  // namespace

std::string_view tokenActionToString(TokenAction action) noexcept {
  return action_names[static_cast<size_t>(action)];
}

std::optional<TokenAction> tokenActionFromString(std::string_view text) {
  for (size_t i = 0; i < action_names.size(); ++i) {
    if (action_names[i] == text) return static_cast<TokenAction>(i);
  }
  return std::nullopt;
}

std::string generateTokenId() {
  return std::string(TOKEN_PREFIX) + randomHex(16);
}

std::string getTokenKvKey(std::string_view tokenId) {
  return std::string(TOKEN_KEY_PREFIX) + std::string(tokenId);
}

bool isValidTokenId(std::string_view tokenId) noexcept {
  return tokenId.starts_with(TOKEN_PREFIX) && tokenId.size() == TOKEN_ID_LENGTH;
}

StatefulToken createIdentityClaimToken(const IdentityClaimTokenParams& params) {
  return stamp(params.createdBy, params.label,
               params.expiresInSeconds.value_or(DEFAULT_STATEFUL_TOKEN_TTL_SECONDS),
               IdentityClaimPayload{params.identityId});
}

StatefulToken createBlobAccessToken(const BlobAccessTokenParams& params) {
  return stamp(params.createdBy, params.label,
               params.expiresInSeconds.value_or(DEFAULT_STATEFUL_TOKEN_TTL_SECONDS),
               BlobAccessPayload{params.namespace_, params.blobKey,
                                 params.permissions});
}

StatefulToken createChannelAccessToken(const ChannelAccessTokenParams& params) {
  return stamp(params.createdBy, params.label,
               params.expiresInSeconds.value_or(DEFAULT_STATEFUL_TOKEN_TTL_SECONDS),
               ChannelAccessPayload{params.channelId, params.permissions});
}

bool isTokenExpired(const StatefulToken& token) {
  return isTokenExpired(token, Clock::now());
}

bool isTokenExpired(const StatefulToken& token, Timestamp now) {
  return token.expiresAt < now;
}

bool isTokenRevoked(const StatefulToken& token) noexcept { return token.revoked; }

bool isTokenUsed(const StatefulToken& token) noexcept {
  return token.usedAt.has_value();
}

bool isTokenValid(const StatefulToken& token) {
  return isTokenValid(token, Clock::now());
}

bool isTokenValid(const StatefulToken& token, Timestamp now) {
  return !isTokenExpired(token, now) && !isTokenRevoked(token) &&
         !isTokenUsed(token);
}

std::optional<std::string> getTokenInvalidReason(const StatefulToken& token) {
  return getTokenInvalidReason(token, Clock::now());
}

std::optional<std::string> getTokenInvalidReason(const StatefulToken& token,
                                                 Timestamp now) {
  if (isTokenExpired(token, now)) {
    return "Token has expired";
  }
  if (isTokenRevoked(token)) {
    if (token.revokedReason && !token.revokedReason->empty()) {
      return *token.revokedReason;
    }
    return "Token has been revoked";
  }
  if (isTokenUsed(token)) {
    return "Token has already been used";
  }
  return std::nullopt;
}

StatefulToken markTokenUsed(const StatefulToken& token, std::string usedBy) {
  StatefulToken used = token;
  used.usedAt = Clock::now();
  used.usedBy = std::move(usedBy);
  return used;
}

StatefulToken revokeToken(const StatefulToken& token,
                          std::optional<std::string> reason) {
  StatefulToken revoked = token;
  revoked.revoked = true;
  revoked.revokedAt = Clock::now();
  revoked.revokedReason = std::move(reason);
  return revoked;
}

std::string serializeToken(const StatefulToken& token) {
  return json_serialization::to_compact_json(token);
}

std::optional<StatefulToken> deserializeToken(std::string_view json) {
  return json_serialization::from_json_text<StatefulToken>(json);
}

std::string buildTokenShareUrl(std::string_view tokenId,
                               std::string_view gatewayUrl,
                               std::string_view baseUrl) {
  std::string_view base = baseUrl.empty() ? gatewayUrl : baseUrl;
  std::string url(base);
  url += "/claim?token=";
  url += tokenId;
  url += "&gateway=";
  url += urlEncodeComponent(gatewayUrl);
  return url;
}

std::string buildCompactTokenShareUrl(std::string_view tokenId,
                                      std::string_view gatewayUrl,
                                      std::string_view baseUrl) {
  std::string url(baseUrl);
  url += '#';
  url += tokenId;
  url += '@';
  url += base64Encode(gatewayUrl);
  return url;
}

std::optional<CompactShareTarget> parseCompactTokenShareUrl(
    std::string_view url) {
  const auto hashPos = url.find('#');
  if (hashPos == std::string_view::npos) {
    return std::nullopt;
  }
  std::string_view fragment = url.substr(hashPos + 1);
  const auto atPos = fragment.find('@');
  if (atPos == std::string_view::npos) {
    return std::nullopt;
  }

  std::string_view tokenId = fragment.substr(0, atPos);
  std::string_view encodedGateway = fragment.substr(atPos + 1);
  // A second '@' ends the encoded gateway
  encodedGateway = encodedGateway.substr(0, encodedGateway.find('@'));
  if (tokenId.empty() || encodedGateway.empty() ||
      !tokenId.starts_with(TOKEN_PREFIX)) {
    return std::nullopt;
  }

  try {
    auto gateway = base64Decode(encodedGateway);
    return CompactShareTarget{std::string(tokenId),
                              std::string(gateway.begin(), gateway.end())};
  } catch (const InvalidBase64Error&) {
    return std::nullopt;
  }
}

StatefulTokenStore::StatefulTokenStore(KeyValueStore& kv, AuthConfig config)
    : kv_(kv), config_(std::move(config)) {
  config_.validate();
}

int64_t StatefulTokenStore::ttl(const std::optional<int64_t>& requested) const {
  return requested.value_or(config_.statefulTokenTtl());
}

StatefulToken StatefulTokenStore::issueIdentityClaimToken(
    IdentityClaimTokenParams params) {
  params.expiresInSeconds = ttl(params.expiresInSeconds);
  StatefulToken token = createIdentityClaimToken(params);
  save(token);
  TESSERA_LOG_INFO("Issued identity claim token {} for {}", token.id,
                   params.identityId);
  return token;
}

StatefulToken StatefulTokenStore::issueBlobAccessToken(
    BlobAccessTokenParams params) {
  params.expiresInSeconds = ttl(params.expiresInSeconds);
  StatefulToken token = createBlobAccessToken(params);
  save(token);
  TESSERA_LOG_INFO("Issued blob access token {}", token.id);
  return token;
}

StatefulToken StatefulTokenStore::issueChannelAccessToken(
    ChannelAccessTokenParams params) {
  params.expiresInSeconds = ttl(params.expiresInSeconds);
  StatefulToken token = createChannelAccessToken(params);
  save(token);
  TESSERA_LOG_INFO("Issued channel access token {}", token.id);
  return token;
}

void StatefulTokenStore::save(const StatefulToken& token) {
  kv_.put(getTokenKvKey(token.id), serializeToken(token));
}

std::optional<StatefulToken> StatefulTokenStore::load(std::string_view tokenId) {
  auto stored = kv_.get(getTokenKvKey(tokenId));
  if (!stored) {
    return std::nullopt;
  }
  return deserializeToken(*stored);
}

TokenLookupResult StatefulTokenStore::lookup(std::string_view tokenId) {
  if (!isValidTokenId(tokenId)) {
    return failure("Invalid token format");
  }
  auto stored = kv_.get(getTokenKvKey(tokenId));
  if (!stored) {
    return failure("Token not found");
  }
  auto token = deserializeToken(*stored);
  if (!token) {
    TESSERA_LOG_WARN("Stored token {} could not be decoded", tokenId);
    return failure("Invalid token data");
  }

  if (auto reason = getTokenInvalidReason(*token)) {
    return TokenLookupResult{false, std::move(token), std::move(reason)};
  }
  return TokenLookupResult{true, std::move(token), std::nullopt};
}

TokenLookupResult StatefulTokenStore::revoke(std::string_view tokenId,
                                             std::optional<std::string> reason) {
  if (!isValidTokenId(tokenId)) {
    return failure("Invalid token format");
  }
  auto stored = kv_.get(getTokenKvKey(tokenId));
  if (!stored) {
    return failure("Token not found");
  }
  auto token = deserializeToken(*stored);
  if (!token) {
    return failure("Invalid token data");
  }
  if (isTokenRevoked(*token)) {
    return TokenLookupResult{false, std::move(token),
                             "Token is already revoked"};
  }

  StatefulToken revoked = revokeToken(*token, std::move(reason));
  save(revoked);
  TESSERA_LOG_INFO("Revoked token {}", revoked.id);
  return TokenLookupResult{true, std::move(revoked), std::nullopt};
}

ClaimIdentityResult StatefulTokenStore::claimIdentity(std::string_view tokenId) {
  TokenLookupResult found = lookup(tokenId);
  if (!found.valid) {
    return claimFailure(found.error.value_or("Token is invalid"));
  }
  const StatefulToken& token = *found.token;

  const auto* claim = std::get_if<IdentityClaimPayload>(&token.payload);
  if (!claim) {
    return claimFailure("This token cannot be used for identity claim");
  }

  auto storedIdentity = kv_.get(identityKvKey(claim->identityId));
  if (!storedIdentity) {
    return claimFailure("Identity not found");
  }
  auto identity = deserializeIdentity(*storedIdentity);
  if (!identity) {
    return claimFailure("Invalid identity data");
  }
  if (identity->status != IdentityStatus::PendingClaim) {
    return claimFailure("Identity has already been claimed");
  }

  CreateCredentialParams params;
  params.identityId = identity->id;
  params.type = CredentialType::ApiKey;
  CreatedCredential created =
      createCredential(params, config_.credentialSecretBytes());

  Identity activated = activateIdentity(*identity);
  StatefulToken used = markTokenUsed(token, activated.id);

  const std::string credentialJson = serializeCredential(created.credential);
  kv_.put(identityKvKey(activated.id), serializeIdentity(activated));
  kv_.put(credentialKvKey(created.credential.secretHash), credentialJson);
  kv_.put(credentialIdKvKey(created.credential.id), credentialJson);
  save(used);

  TESSERA_LOG_INFO("Identity {} claimed with token {}", activated.id, used.id);

  ClaimIdentityResult result;
  result.success = true;
  result.identity = std::move(activated);
  result.credential = std::move(created.credential);
  result.secret = std::move(created.secret);
  return result;
}

}  // namespace tessera
