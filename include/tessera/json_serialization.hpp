/**
 * @file json_serialization.hpp
 * @brief JSON persistence for credentials, identities, grants and stateful
 *        tokens
 *
 * Timestamps are written as ISO-8601 UTC strings; optional fields are only
 * emitted when present. The from_json overloads throw InvalidJsonError on a
 * missing required field or a value of the wrong type.
 */

#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

#include "credential.hpp"
#include "error.hpp"
#include "grants.hpp"
#include "identity.hpp"
#include "stateful_token.hpp"

namespace tessera {

namespace json_serialization {

void to_json(nlohmann::json& j, const ResourceScope& scope);
void to_json(nlohmann::json& j, const CredentialScope& scope);
void to_json(nlohmann::json& j, const Credential& credential);
void to_json(nlohmann::json& j, const AppConfig& config);
void to_json(nlohmann::json& j, const Identity& identity);
void to_json(nlohmann::json& j, const ResourceRef& ref);
void to_json(nlohmann::json& j, const GrantScope& scope);
void to_json(nlohmann::json& j, const CapabilityGrant& grant);
void to_json(nlohmann::json& j, const StatefulToken& token);

void from_json(const nlohmann::json& j, ResourceScope& scope);
void from_json(const nlohmann::json& j, CredentialScope& scope);
void from_json(const nlohmann::json& j, Credential& credential);
void from_json(const nlohmann::json& j, AppConfig& config);
void from_json(const nlohmann::json& j, Identity& identity);
void from_json(const nlohmann::json& j, ResourceRef& ref);
void from_json(const nlohmann::json& j, GrantScope& scope);
void from_json(const nlohmann::json& j, CapabilityGrant& grant);
void from_json(const nlohmann::json& j, StatefulToken& token);

/**
 * @brief Compact JSON text for any type with a to_json overload above
 */
template <typename T>
std::string to_compact_json(const T& value) {
  nlohmann::json j;
  to_json(j, value);
  return j.dump();
}

/**
 * @brief Parse stored JSON text
 * @return The decoded value, or nullopt if the text is not valid JSON or
 *         from_json rejects it
 */
template <typename T>
std::optional<T> from_json_text(std::string_view text) {
  auto document = nlohmann::json::parse(text, nullptr, false);
  if (document.is_discarded()) {
    return std::nullopt;
  }
  T value;
  try {
    from_json(document, value);
  } catch (const InvalidJsonError&) {
    return std::nullopt;
  }
  return value;
}

}  // namespace json_serialization

inline std::string serializeCredential(const Credential& credential) {
  return json_serialization::to_compact_json(credential);
}

inline std::optional<Credential> deserializeCredential(std::string_view json) {
  return json_serialization::from_json_text<Credential>(json);
}

inline std::string serializeIdentity(const Identity& identity) {
  return json_serialization::to_compact_json(identity);
}

inline std::optional<Identity> deserializeIdentity(std::string_view json) {
  return json_serialization::from_json_text<Identity>(json);
}

inline std::string serializeGrant(const CapabilityGrant& grant) {
  return json_serialization::to_compact_json(grant);
}

inline std::optional<CapabilityGrant> deserializeGrant(std::string_view json) {
  return json_serialization::from_json_text<CapabilityGrant>(json);
}

}  // namespace tessera
