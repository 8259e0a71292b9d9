#include "tessera/credential.hpp"

#include "tessera/crypto.hpp"
#include "tessera/error.hpp"
#include "tessera/logging.hpp"
#include "tessera/secure_vector.hpp"

namespace tessera {

namespace {

constexpr std::string_view CREDENTIAL_ID_PREFIX = "cred_";
constexpr std::string_view CREDENTIAL_KEY_PREFIX = "__CREDENTIAL:";
constexpr std::string_view CREDENTIAL_ID_KEY_PREFIX = "__CREDENTIAL_ID:";

std::string generateCredentialId() {
  return std::string(CREDENTIAL_ID_PREFIX) + randomHex(16);
}

Credential issue(std::string identityId, CredentialType type,
                 std::optional<Timestamp> expiresAt,
                 std::optional<CredentialScope> scope,
                 const std::string& secret) {
  Credential credential;
  credential.id = generateCredentialId();
  credential.identityId = std::move(identityId);
  credential.type = type;
  credential.secretHash = hashApiKey(secret);
  credential.status = CredentialStatus::Active;
  credential.createdAt = Clock::now();
  credential.expiresAt = expiresAt;
  credential.scope = std::move(scope);
  return credential;
}

VerifyCredentialResult rejected(CredentialFailure reason) {
  return VerifyCredentialResult{false, std::nullopt, reason};
}

}  // namespace

std::optional<CredentialType> credentialTypeFromString(std::string_view text) {
  for (auto type : {CredentialType::ApiKey, CredentialType::BearerToken,
                    CredentialType::RefreshToken, CredentialType::Invitation}) {
    if (credentialTypeToString(type) == text) return type;
  }
  return std::nullopt;
}

std::optional<CredentialStatus> credentialStatusFromString(
    std::string_view text) {
  for (auto status : {CredentialStatus::Active, CredentialStatus::Rotating,
                      CredentialStatus::Revoked}) {
    if (credentialStatusToString(status) == text) return status;
  }
  return std::nullopt;
}

std::string generateApiKey(size_t secretBytes) {
  if (secretBytes == 0) {
    throw InvalidArgumentError("Secret length must be at least one byte");
  }
  return randomHex(secretBytes);
}

std::string hashApiKey(std::string_view secret) { return sha256Hex(secret); }

CreatedCredential createCredential(const CreateCredentialParams& params,
                                   size_t secretBytes) {
  if (params.identityId.empty()) {
    throw InvalidArgumentError("identityId is required");
  }

  std::string secret = generateApiKey(secretBytes);
  Credential credential = issue(params.identityId, params.type,
                                params.expiresAt, params.scope, secret);

  TESSERA_LOG_INFO("Created {} credential {} for identity {}",
                   credentialTypeToString(credential.type), credential.id,
                   credential.identityId);
  return CreatedCredential{std::move(credential), std::move(secret)};
}

VerifyCredentialResult verifyCredential(const Credential& credential,
                                        std::string_view secret) {
  return verifyCredential(credential, secret, Clock::now());
}

VerifyCredentialResult verifyCredential(const Credential& credential,
                                        std::string_view secret,
                                        Timestamp now) {
  if (credential.status == CredentialStatus::Revoked) {
    return rejected(CredentialFailure::Revoked);
  }
  if (credential.expiresAt && now > *credential.expiresAt) {
    return rejected(CredentialFailure::Expired);
  }
  if (credential.scope && credential.scope->expiresAt &&
      now > *credential.scope->expiresAt) {
    return rejected(CredentialFailure::ScopeExpired);
  }

  const std::string presented = hashApiKey(secret);
  if (!secure_utils::constantTimeEqual(presented, credential.secretHash)) {
    TESSERA_LOG_DEBUG("Secret mismatch for credential {}", credential.id);
    return rejected(CredentialFailure::InvalidSecret);
  }
  return VerifyCredentialResult{true, credential.identityId, std::nullopt};
}

RotateCredentialResult rotateCredential(const Credential& credential,
                                        size_t secretBytes) {
  if (credential.status == CredentialStatus::Revoked) {
    throw InvalidStateTransitionError("Cannot rotate a revoked credential");
  }

  std::string newSecret = generateApiKey(secretBytes);
  Credential replacement =
      issue(credential.identityId, credential.type, credential.expiresAt,
            credential.scope, newSecret);

  Credential previous = credential;
  previous.status = CredentialStatus::Rotating;

  TESSERA_LOG_INFO("Rotated credential {} -> {}", previous.id, replacement.id);
  return RotateCredentialResult{std::move(previous), std::move(replacement),
                                std::move(newSecret)};
}

Credential revokeCredential(const Credential& credential, std::string reason) {
  return revokeCredential(credential, std::move(reason), Clock::now());
}

Credential revokeCredential(const Credential& credential, std::string reason,
                            Timestamp now) {
  if (credential.status == CredentialStatus::Revoked) {
    return credential;
  }
  Credential revoked = credential;
  revoked.status = CredentialStatus::Revoked;
  revoked.revokedAt = now;
  revoked.revocationReason = std::move(reason);
  TESSERA_LOG_INFO("Revoked credential {}", revoked.id);
  return revoked;
}

std::string credentialKvKey(std::string_view secretHash) {
  return std::string(CREDENTIAL_KEY_PREFIX) + std::string(secretHash);
}

std::string credentialIdKvKey(std::string_view credentialId) {
  return std::string(CREDENTIAL_ID_KEY_PREFIX) + std::string(credentialId);
}

}  // namespace tessera
