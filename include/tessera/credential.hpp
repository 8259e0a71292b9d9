/**
 * @file credential.hpp
 * @brief Identity-bound secret credentials: issue, verify, rotate, revoke
 *
 * Only the SHA-256 of a secret is ever stored. The plaintext is handed back
 * once, from createCredential or rotateCredential.
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "time_utils.hpp"

namespace tessera {

enum class CredentialType { ApiKey, BearerToken, RefreshToken, Invitation };

enum class CredentialStatus { Active, Rotating, Revoked };

constexpr std::string_view credentialTypeToString(CredentialType type) noexcept {
  switch (type) {
    case CredentialType::ApiKey:
      return "api_key";
    case CredentialType::BearerToken:
      return "bearer_token";
    case CredentialType::RefreshToken:
      return "refresh_token";
    case CredentialType::Invitation:
      return "invitation";
  }
  return "api_key";
}

constexpr std::string_view credentialStatusToString(
    CredentialStatus status) noexcept {
  switch (status) {
    case CredentialStatus::Active:
      return "active";
    case CredentialStatus::Rotating:
      return "rotating";
    case CredentialStatus::Revoked:
      return "revoked";
  }
  return "active";
}

std::optional<CredentialType> credentialTypeFromString(std::string_view text);
std::optional<CredentialStatus> credentialStatusFromString(std::string_view text);

struct ResourceScope {
  std::string type;
  std::string id;
  std::vector<std::string> permissions;

  bool operator==(const ResourceScope&) const = default;
};

/**
 * @brief Optional narrowing of what a credential may do; absent = unrestricted
 */
struct CredentialScope {
  std::optional<std::vector<std::string>> capabilities;
  std::optional<std::vector<std::string>> namespaces;
  std::optional<std::vector<ResourceScope>> resources;
  std::optional<Timestamp> expiresAt;

  bool operator==(const CredentialScope&) const = default;
};

struct Credential {
  std::string id;  ///< cred_<32 hex>
  std::string identityId;
  CredentialType type = CredentialType::ApiKey;
  std::string secretHash;  ///< lowercase hex SHA-256 of the secret
  CredentialStatus status = CredentialStatus::Active;
  Timestamp createdAt;
  std::optional<Timestamp> expiresAt;
  std::optional<Timestamp> lastUsedAt;
  std::optional<CredentialScope> scope;
  std::optional<std::string> revocationReason;
  std::optional<Timestamp> revokedAt;
};

struct CreateCredentialParams {
  std::string identityId;
  CredentialType type = CredentialType::ApiKey;
  std::optional<Timestamp> expiresAt;
  std::optional<CredentialScope> scope;
};

struct CreatedCredential {
  Credential credential;
  std::string secret;  ///< plaintext, shown once
};

enum class CredentialFailure { Revoked, Expired, ScopeExpired, InvalidSecret };

constexpr std::string_view credentialFailureToString(
    CredentialFailure failure) noexcept {
  switch (failure) {
    case CredentialFailure::Revoked:
      return "revoked";
    case CredentialFailure::Expired:
      return "expired";
    case CredentialFailure::ScopeExpired:
      return "scope_expired";
    case CredentialFailure::InvalidSecret:
      return "invalid_secret";
  }
  return "invalid_secret";
}

struct VerifyCredentialResult {
  bool valid = false;
  std::optional<std::string> identityId;
  std::optional<CredentialFailure> reason;
};

struct RotateCredentialResult {
  Credential oldCredential;  ///< status rotating, still verifies
  Credential newCredential;
  std::string newSecret;
};

constexpr size_t DEFAULT_SECRET_BYTES = 32;

/**
 * @brief Random secret rendered as hex (2 chars per byte)
 */
std::string generateApiKey(size_t secretBytes = DEFAULT_SECRET_BYTES);

/**
 * @brief Lowercase hex SHA-256 of the secret
 */
std::string hashApiKey(std::string_view secret);

/**
 * @throws InvalidArgumentError if identityId is empty or secretBytes is 0
 */
CreatedCredential createCredential(const CreateCredentialParams& params,
                                   size_t secretBytes = DEFAULT_SECRET_BYTES);

/**
 * @brief Check a presented secret against a stored credential
 *
 * Order: revoked, expired, scope expired, secret hash. The first failing
 * check is reported. Expiry is strict: a credential is still valid at the
 * exact expiry instant.
 */
VerifyCredentialResult verifyCredential(const Credential& credential,
                                        std::string_view secret);
VerifyCredentialResult verifyCredential(const Credential& credential,
                                        std::string_view secret, Timestamp now);

/**
 * @brief Issue a replacement with identical type, expiry and scope
 *
 * The old credential is returned as rotating and keeps verifying until it
 * is revoked explicitly.
 * @throws InvalidStateTransitionError if the credential is already revoked
 */
RotateCredentialResult rotateCredential(const Credential& credential,
                                        size_t secretBytes = DEFAULT_SECRET_BYTES);

/**
 * @brief Mark revoked; idempotent, the first reason and time are kept
 */
Credential revokeCredential(const Credential& credential, std::string reason);
Credential revokeCredential(const Credential& credential, std::string reason,
                            Timestamp now);

std::string credentialKvKey(std::string_view secretHash);
std::string credentialIdKvKey(std::string_view credentialId);

}  // namespace tessera
