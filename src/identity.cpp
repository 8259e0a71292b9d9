#include "tessera/identity.hpp"

#include <array>
#include <cctype>

#include "tessera/crypto.hpp"
#include "tessera/error.hpp"
#include "tessera/logging.hpp"

namespace tessera {

namespace {

constexpr std::string_view IDENTITY_ID_PREFIX = "ident_";
constexpr std::string_view IDENTITY_KEY_PREFIX = "__IDENTITY:";

constexpr std::array<IdentityType, 5> all_types{
    IdentityType::User, IdentityType::Service, IdentityType::Agent,
    IdentityType::App, IdentityType::Anonymous};

constexpr std::array<IdentityStatus, 4> all_statuses{
    IdentityStatus::PendingClaim, IdentityStatus::Active,
    IdentityStatus::Suspended, IdentityStatus::Deleted};

bool isBlank(std::string_view text) noexcept {
  for (char c : text) {
    if (!std::isspace(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

void validate(const CreateIdentityParams& params) {
  if (!params.type) {
    throw InvalidArgumentError("type is required");
  }
  if (isBlank(params.displayName)) {
    throw InvalidArgumentError("displayName is required");
  }
  if (*params.type == IdentityType::App &&
      (!params.appConfig || params.appConfig->origin.empty())) {
    throw InvalidArgumentError("origin is required for APP identity");
  }
}

Identity build(const CreateIdentityParams& params, IdentityStatus status) {
  Identity identity;
  identity.id = std::string(IDENTITY_ID_PREFIX) + randomHex(16);
  identity.type = *params.type;
  identity.displayName = params.displayName;
  identity.status = status;
  identity.createdAt = Clock::now();
  identity.createdBy = params.createdBy;
  identity.metadata =
      params.metadata.is_object() ? params.metadata : nlohmann::json::object();

  if (*params.type == IdentityType::App) {
    AppConfig config = *params.appConfig;
    if (config.namespace_.empty()) {
      config.namespace_ = originToNamespace(config.origin);
    }
    identity.appConfig = std::move(config);
  }
  return identity;
}

bool isNamespaceChar(char c) noexcept {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

}  // namespace

std::string_view identityTypeToString(IdentityType type) noexcept {
  switch (type) {
    case IdentityType::User:
      return "user";
    case IdentityType::Service:
      return "service";
    case IdentityType::Agent:
      return "agent";
    case IdentityType::App:
      return "app";
    case IdentityType::Anonymous:
      return "anonymous";
  }
  return "user";
}

std::string_view identityStatusToString(IdentityStatus status) noexcept {
  switch (status) {
    case IdentityStatus::PendingClaim:
      return "pending_claim";
    case IdentityStatus::Active:
      return "active";
    case IdentityStatus::Suspended:
      return "suspended";
    case IdentityStatus::Deleted:
      return "deleted";
  }
  return "active";
}

std::optional<IdentityType> identityTypeFromString(std::string_view text) {
  for (auto type : all_types) {
    if (identityTypeToString(type) == text) return type;
  }
  return std::nullopt;
}

std::optional<IdentityStatus> identityStatusFromString(std::string_view text) {
  for (auto status : all_statuses) {
    if (identityStatusToString(status) == text) return status;
  }
  return std::nullopt;
}

std::string originToNamespace(std::string_view origin) {
  for (std::string_view scheme : {"https://", "http://"}) {
    if (origin.starts_with(scheme)) {
      origin.remove_prefix(scheme.size());
      break;
    }
  }
  if (origin.ends_with('/')) {
    origin.remove_suffix(1);
  }

  std::string ns;
  ns.reserve(origin.size());
  for (char c : origin) {
    if (c == '.' || c == ':') {
      ns.push_back('_');
    } else if (isNamespaceChar(c)) {
      ns.push_back(c);
    }
  }
  return ns;
}

Identity createIdentity(const CreateIdentityParams& params) {
  validate(params);
  Identity identity = build(params, IdentityStatus::Active);
  TESSERA_LOG_INFO("Created {} identity {}", identityTypeToString(identity.type),
                   identity.id);
  return identity;
}

Identity createClaimableIdentity(const CreateIdentityParams& params) {
  validate(params);
  if (!params.createdBy || params.createdBy->empty()) {
    throw InvalidArgumentError("createdBy is required for claimable identities");
  }
  Identity identity = build(params, IdentityStatus::PendingClaim);
  TESSERA_LOG_INFO("Created claimable identity {} by {}", identity.id,
                   *identity.createdBy);
  return identity;
}

Identity activateIdentity(const Identity& identity) {
  if (identity.status != IdentityStatus::PendingClaim) {
    throw InvalidStateTransitionError(
        "Only PENDING_CLAIM identities can be activated");
  }
  Identity activated = identity;
  activated.status = IdentityStatus::Active;
  return activated;
}

Identity updateIdentity(const Identity& identity, const IdentityUpdate& update) {
  if (identity.status == IdentityStatus::Deleted) {
    throw InvalidStateTransitionError("Cannot update a deleted identity");
  }
  Identity updated = identity;
  if (update.displayName && !isBlank(*update.displayName)) {
    updated.displayName = *update.displayName;
  }
  if (update.metadata && update.metadata->is_object()) {
    if (!updated.metadata.is_object()) {
      updated.metadata = nlohmann::json::object();
    }
    for (const auto& [key, value] : update.metadata->items()) {
      updated.metadata[key] = value;
    }
  }
  return updated;
}

Identity deleteIdentity(const Identity& identity) {
  Identity deleted = identity;
  deleted.status = IdentityStatus::Deleted;
  TESSERA_LOG_INFO("Deleted identity {}", identity.id);
  return deleted;
}

Identity suspendIdentity(const Identity& identity) {
  if (identity.status == IdentityStatus::Deleted) {
    throw InvalidStateTransitionError("Cannot suspend a deleted identity");
  }
  Identity suspended = identity;
  suspended.status = IdentityStatus::Suspended;
  return suspended;
}

std::string identityKvKey(std::string_view identityId) {
  return std::string(IDENTITY_KEY_PREFIX) + std::string(identityId);
}

}  // namespace tessera
