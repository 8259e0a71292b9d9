/**
 * @file json_serialization.cpp
 * @brief JSON persistence for tessera records
 */

#include "tessera/json_serialization.hpp"

#include <type_traits>
#include <variant>

#include "tessera/time_utils.hpp"

namespace tessera {
namespace json_serialization {

namespace {

using nlohmann::json;

const json& requireField(const json& j, const char* key) {
    if (!j.is_object() || !j.contains(key)) {
        throw InvalidJsonError(std::string("missing field '") + key + "'");
    }
    return j.at(key);
}

std::string requireString(const json& j, const char* key) {
    const json& value = requireField(j, key);
    if (!value.is_string()) {
        throw InvalidJsonError(std::string("field '") + key + "' is not a string");
    }
    return value.get<std::string>();
}

std::optional<std::string> optionalString(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    return requireString(j, key);
}

Timestamp parseTime(const json& value, const char* key) {
    if (!value.is_string()) {
        throw InvalidJsonError(std::string("field '") + key + "' is not a timestamp");
    }
    auto parsed = parseIsoString(value.get<std::string>());
    if (!parsed) {
        throw InvalidJsonError(std::string("field '") + key + "' is not ISO-8601");
    }
    return *parsed;
}

Timestamp requireTime(const json& j, const char* key) {
    return parseTime(requireField(j, key), key);
}

std::optional<Timestamp> optionalTime(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    return parseTime(j.at(key), key);
}

std::vector<std::string> stringList(const json& value, const char* key) {
    if (!value.is_array()) {
        throw InvalidJsonError(std::string("field '") + key + "' is not an array");
    }
    std::vector<std::string> result;
    for (const auto& entry : value) {
        if (!entry.is_string()) {
            throw InvalidJsonError(std::string("field '") + key +
                                   "' has a non-string entry");
        }
        result.push_back(entry.get<std::string>());
    }
    return result;
}

std::optional<std::vector<std::string>> optionalStringList(const json& j,
                                                           const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    return stringList(j.at(key), key);
}

template <typename T>
std::optional<std::vector<T>> optionalObjectList(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    const json& value = j.at(key);
    if (!value.is_array()) {
        throw InvalidJsonError(std::string("field '") + key + "' is not an array");
    }
    std::vector<T> result;
    for (const auto& entry : value) {
        T item;
        from_json(entry, item);
        result.push_back(std::move(item));
    }
    return result;
}

template <typename T>
json objectList(const std::vector<T>& items) {
    json array = json::array();
    for (const auto& item : items) {
        json entry;
        to_json(entry, item);
        array.push_back(std::move(entry));
    }
    return array;
}

template <typename Enum, typename Parse>
Enum requireEnum(const json& j, const char* key, Parse parse) {
    auto parsed = parse(requireString(j, key));
    if (!parsed) {
        throw InvalidJsonError(std::string("field '") + key + "' has an unknown value");
    }
    return *parsed;
}

}  // namespace

void to_json(nlohmann::json& j, const ResourceScope& scope) {
    j = json{{"type", scope.type}, {"id", scope.id}, {"permissions", scope.permissions}};
}

void to_json(nlohmann::json& j, const CredentialScope& scope) {
    j = json::object();
    if (scope.capabilities) {
        j["capabilities"] = *scope.capabilities;
    }
    if (scope.namespaces) {
        j["namespaces"] = *scope.namespaces;
    }
    if (scope.resources) {
        j["resources"] = objectList(*scope.resources);
    }
    if (scope.expiresAt) {
        j["expiresAt"] = toIsoString(*scope.expiresAt);
    }
}

void to_json(nlohmann::json& j, const Credential& credential) {
    j = json::object();
    j["id"] = credential.id;
    j["identityId"] = credential.identityId;
    j["type"] = std::string(credentialTypeToString(credential.type));
    j["secretHash"] = credential.secretHash;
    j["status"] = std::string(credentialStatusToString(credential.status));
    j["createdAt"] = toIsoString(credential.createdAt);

    if (credential.expiresAt) {
        j["expiresAt"] = toIsoString(*credential.expiresAt);
    }
    if (credential.lastUsedAt) {
        j["lastUsedAt"] = toIsoString(*credential.lastUsedAt);
    }
    if (credential.scope) {
        to_json(j["scope"], *credential.scope);
    }
    if (credential.revokedAt) {
        j["revokedAt"] = toIsoString(*credential.revokedAt);
    }
    if (credential.revocationReason) {
        j["revocationReason"] = *credential.revocationReason;
    }
}

void to_json(nlohmann::json& j, const AppConfig& config) {
    j = json{{"origin", config.origin},
             {"namespace", config.namespace_},
             {"grantedCapabilities", config.grantedCapabilities},
             {"frameAccess", config.frameAccess}};
}

void to_json(nlohmann::json& j, const Identity& identity) {
    j = json::object();
    j["id"] = identity.id;
    j["type"] = std::string(identityTypeToString(identity.type));
    j["displayName"] = identity.displayName;
    j["status"] = std::string(identityStatusToString(identity.status));
    j["createdAt"] = toIsoString(identity.createdAt);

    if (identity.createdBy) {
        j["createdBy"] = *identity.createdBy;
    }
    if (identity.appConfig) {
        to_json(j["appConfig"], *identity.appConfig);
    }
    if (identity.metadata.is_object() && !identity.metadata.empty()) {
        j["metadata"] = identity.metadata;
    }
}

void to_json(nlohmann::json& j, const ResourceRef& ref) {
    j = json{{"type", ref.type}, {"id", ref.id}};
}

void to_json(nlohmann::json& j, const GrantScope& scope) {
    j = json::object();
    if (scope.namespaces) {
        j["namespaces"] = *scope.namespaces;
    }
    if (scope.resources) {
        j["resources"] = objectList(*scope.resources);
    }
    if (scope.keyPatterns) {
        j["keyPatterns"] = *scope.keyPatterns;
    }
}

void to_json(nlohmann::json& j, const CapabilityGrant& grant) {
    j = json::object();
    j["grantId"] = grant.grantId;
    j["identityId"] = grant.identityId;
    j["capability"] = grant.capability;
    j["grantedAt"] = toIsoString(grant.grantedAt);
    j["grantedBy"] = grant.grantedBy;
    j["source"] = std::string(grantSourceToString(grant.source));

    if (grant.sourceId) {
        j["sourceId"] = *grant.sourceId;
    }
    if (grant.scope) {
        to_json(j["scope"], *grant.scope);
    }
    if (grant.expiresAt) {
        j["expiresAt"] = toIsoString(*grant.expiresAt);
    }
    if (grant.revokedAt) {
        j["revokedAt"] = toIsoString(*grant.revokedAt);
    }
    if (grant.revokedBy) {
        j["revokedBy"] = *grant.revokedBy;
    }
    if (grant.revocationReason) {
        j["revocationReason"] = *grant.revocationReason;
    }
}

void to_json(nlohmann::json& j, const StatefulToken& token) {
    j = json::object();
    j["id"] = token.id;
    j["action"] = std::string(tokenActionToString(token.action()));
    j["createdAt"] = toIsoString(token.createdAt);
    j["expiresAt"] = toIsoString(token.expiresAt);
    j["createdBy"] = token.createdBy;

    if (token.label) {
        j["label"] = *token.label;
    }
    if (token.usedAt) {
        j["usedAt"] = toIsoString(*token.usedAt);
    }
    if (token.usedBy) {
        j["usedBy"] = *token.usedBy;
    }
    if (token.revoked) {
        j["revoked"] = true;
    }
    if (token.revokedAt) {
        j["revokedAt"] = toIsoString(*token.revokedAt);
    }
    if (token.revokedReason) {
        j["revokedReason"] = *token.revokedReason;
    }

    std::visit(
        [&j](const auto& payload) {
            using T = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<T, IdentityClaimPayload>) {
                j["payload"] = json{{"identityId", payload.identityId}};
            } else if constexpr (std::is_same_v<T, BlobAccessPayload>) {
                j["payload"] = json{{"namespace", payload.namespace_},
                                    {"blobKey", payload.blobKey},
                                    {"permissions", payload.permissions}};
            } else {
                j["payload"] = json{{"channelId", payload.channelId},
                                    {"permissions", payload.permissions}};
            }
        },
        token.payload);
}

void from_json(const nlohmann::json& j, ResourceScope& scope) {
    scope.type = requireString(j, "type");
    scope.id = requireString(j, "id");
    scope.permissions = j.contains("permissions")
                            ? stringList(j.at("permissions"), "permissions")
                            : std::vector<std::string>{};
}

void from_json(const nlohmann::json& j, CredentialScope& scope) {
    if (!j.is_object()) {
        throw InvalidJsonError("scope is not an object");
    }
    scope = CredentialScope{};
    scope.capabilities = optionalStringList(j, "capabilities");
    scope.namespaces = optionalStringList(j, "namespaces");
    scope.resources = optionalObjectList<ResourceScope>(j, "resources");
    scope.expiresAt = optionalTime(j, "expiresAt");
}

void from_json(const nlohmann::json& j, Credential& credential) {
    credential = Credential{};
    credential.id = requireString(j, "id");
    credential.identityId = requireString(j, "identityId");
    credential.type = requireEnum<CredentialType>(j, "type", credentialTypeFromString);
    credential.secretHash = requireString(j, "secretHash");
    credential.status =
        requireEnum<CredentialStatus>(j, "status", credentialStatusFromString);
    credential.createdAt = requireTime(j, "createdAt");
    credential.expiresAt = optionalTime(j, "expiresAt");
    credential.lastUsedAt = optionalTime(j, "lastUsedAt");
    if (j.contains("scope") && !j.at("scope").is_null()) {
        CredentialScope scope;
        from_json(j.at("scope"), scope);
        credential.scope = std::move(scope);
    }
    credential.revokedAt = optionalTime(j, "revokedAt");
    credential.revocationReason = optionalString(j, "revocationReason");
}

void from_json(const nlohmann::json& j, AppConfig& config) {
    config.origin = requireString(j, "origin");
    config.namespace_ = optionalString(j, "namespace").value_or("");
    config.grantedCapabilities =
        optionalStringList(j, "grantedCapabilities").value_or(std::vector<std::string>{});
    config.frameAccess = j.contains("frameAccess") && j.at("frameAccess").is_boolean() &&
                         j.at("frameAccess").get<bool>();
}

void from_json(const nlohmann::json& j, Identity& identity) {
    identity = Identity{};
    identity.id = requireString(j, "id");
    identity.type = requireEnum<IdentityType>(j, "type", identityTypeFromString);
    identity.displayName = requireString(j, "displayName");
    identity.status = requireEnum<IdentityStatus>(j, "status", identityStatusFromString);
    identity.createdAt = requireTime(j, "createdAt");
    identity.createdBy = optionalString(j, "createdBy");
    if (j.contains("appConfig") && !j.at("appConfig").is_null()) {
        AppConfig config;
        from_json(j.at("appConfig"), config);
        identity.appConfig = std::move(config);
    }
    if (j.contains("metadata") && j.at("metadata").is_object()) {
        identity.metadata = j.at("metadata");
    }
}

void from_json(const nlohmann::json& j, ResourceRef& ref) {
    ref.type = requireString(j, "type");
    ref.id = requireString(j, "id");
}

void from_json(const nlohmann::json& j, GrantScope& scope) {
    if (!j.is_object()) {
        throw InvalidJsonError("scope is not an object");
    }
    scope = GrantScope{};
    scope.namespaces = optionalStringList(j, "namespaces");
    scope.resources = optionalObjectList<ResourceRef>(j, "resources");
    scope.keyPatterns = optionalStringList(j, "keyPatterns");
}

void from_json(const nlohmann::json& j, CapabilityGrant& grant) {
    grant = CapabilityGrant{};
    grant.grantId = requireString(j, "grantId");
    grant.identityId = requireString(j, "identityId");
    grant.capability = requireString(j, "capability");
    grant.grantedAt = requireTime(j, "grantedAt");
    grant.grantedBy = requireString(j, "grantedBy");
    grant.source = requireEnum<GrantSource>(j, "source", grantSourceFromString);
    grant.sourceId = optionalString(j, "sourceId");
    if (j.contains("scope") && !j.at("scope").is_null()) {
        GrantScope scope;
        from_json(j.at("scope"), scope);
        grant.scope = std::move(scope);
    }
    grant.expiresAt = optionalTime(j, "expiresAt");
    grant.revokedAt = optionalTime(j, "revokedAt");
    grant.revokedBy = optionalString(j, "revokedBy");
    grant.revocationReason = optionalString(j, "revocationReason");
}

void from_json(const nlohmann::json& j, StatefulToken& token) {
    token = StatefulToken{};
    token.id = requireString(j, "id");
    const TokenAction action =
        requireEnum<TokenAction>(j, "action", tokenActionFromString);
    token.createdAt = requireTime(j, "createdAt");
    token.expiresAt = requireTime(j, "expiresAt");
    token.createdBy = optionalString(j, "createdBy").value_or("");
    token.label = optionalString(j, "label");
    token.usedAt = optionalTime(j, "usedAt");
    token.usedBy = optionalString(j, "usedBy");
    token.revoked = j.contains("revoked") && j.at("revoked").is_boolean() &&
                    j.at("revoked").get<bool>();
    token.revokedAt = optionalTime(j, "revokedAt");
    token.revokedReason = optionalString(j, "revokedReason");

    const json& payload = requireField(j, "payload");
    switch (action) {
        case TokenAction::IdentityClaim:
            token.payload = IdentityClaimPayload{requireString(payload, "identityId")};
            break;
        case TokenAction::BlobAccess:
            token.payload = BlobAccessPayload{
                requireString(payload, "namespace"), requireString(payload, "blobKey"),
                stringList(requireField(payload, "permissions"), "permissions")};
            break;
        case TokenAction::ChannelAccess:
            token.payload = ChannelAccessPayload{
                requireString(payload, "channelId"),
                stringList(requireField(payload, "permissions"), "permissions")};
            break;
    }
}

}  // namespace json_serialization
}  // namespace tessera
