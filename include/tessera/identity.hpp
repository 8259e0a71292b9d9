/**
 * @file identity.hpp
 * @brief Identity records and their lifecycle
 *
 * pending_claim -> active -> suspended / deleted. Claimable identities are
 * minted by another identity and activated once through a claim token.
 */

#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "time_utils.hpp"

namespace tessera {

enum class IdentityType { User, Service, Agent, App, Anonymous };

enum class IdentityStatus { PendingClaim, Active, Suspended, Deleted };

std::string_view identityTypeToString(IdentityType type) noexcept;
std::string_view identityStatusToString(IdentityStatus status) noexcept;
std::optional<IdentityType> identityTypeFromString(std::string_view text);
std::optional<IdentityStatus> identityStatusFromString(std::string_view text);

/**
 * @brief Embedded application settings, only meaningful for APP identities
 */
struct AppConfig {
  std::string origin;
  std::string namespace_;  ///< derived from origin when left empty
  std::vector<std::string> grantedCapabilities;
  bool frameAccess = false;
};

struct Identity {
  std::string id;  ///< ident_<32 hex>
  IdentityType type = IdentityType::User;
  std::string displayName;
  IdentityStatus status = IdentityStatus::Active;
  Timestamp createdAt;
  std::optional<std::string> createdBy;
  std::optional<AppConfig> appConfig;
  nlohmann::json metadata = nlohmann::json::object();
};

struct CreateIdentityParams {
  std::optional<IdentityType> type;
  std::string displayName;
  std::optional<std::string> createdBy;
  std::optional<AppConfig> appConfig;
  nlohmann::json metadata = nlohmann::json::object();
};

/**
 * @brief Fields left empty are kept as they are
 *
 * Status is not updatable here; lifecycle changes go through
 * activateIdentity, suspendIdentity and deleteIdentity.
 */
struct IdentityUpdate {
  std::optional<std::string> displayName;  ///< blank values are ignored
  std::optional<nlohmann::json> metadata;  ///< merged key by key
};

/**
 * @brief Derive a storage namespace from a web origin
 *
 * "https://app.example.com:8443" -> "app_example_com_8443"
 */
std::string originToNamespace(std::string_view origin);

/**
 * @brief Create an active identity
 * @throws InvalidArgumentError when type is missing, displayName is blank, or
 *         an APP identity has no origin
 */
Identity createIdentity(const CreateIdentityParams& params);

/**
 * @brief Create a pending_claim identity to be handed over via a claim token
 * @throws InvalidArgumentError as createIdentity, or when createdBy is missing
 */
Identity createClaimableIdentity(const CreateIdentityParams& params);

/**
 * @throws InvalidStateTransitionError unless the identity is pending_claim
 */
Identity activateIdentity(const Identity& identity);

/**
 * @throws InvalidStateTransitionError if the identity is deleted
 */
Identity updateIdentity(const Identity& identity, const IdentityUpdate& update);

Identity deleteIdentity(const Identity& identity);

/**
 * @throws InvalidStateTransitionError if the identity is deleted
 */
Identity suspendIdentity(const Identity& identity);

inline bool isIdentityActive(const Identity& identity) noexcept {
  return identity.status == IdentityStatus::Active;
}

std::string identityKvKey(std::string_view identityId);

}  // namespace tessera
