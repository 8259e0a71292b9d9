/**
 * @file namespace_alias.hpp
 * @brief Short, stable aliases for long origin-derived namespaces
 *
 * Both directions are stored: __NS_ALIAS:<alias> -> namespace and
 * __NS_FULL:<namespace> -> alias.
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "kv_store.hpp"

namespace tessera {

constexpr size_t NAMESPACE_ALIAS_LENGTH = 8;

/**
 * @brief Last 8 characters of base64url(SHA-256(namespace))
 */
std::string generateAlias(std::string_view ns);

/**
 * @brief True for "origin_..." namespaces longer than 40 characters
 */
bool isFullNamespace(std::string_view value) noexcept;

/**
 * @brief Map an alias or full namespace to the full namespace
 *
 * Full namespaces are returned as-is without touching the store.
 */
std::optional<std::string> resolveNamespace(KeyValueStore& kv,
                                            std::string_view value);

std::optional<std::string> getAlias(KeyValueStore& kv, std::string_view ns);

/**
 * @brief Existing alias, or a newly stored one
 *
 * If the hashed alias is already taken by another namespace, two random
 * base36 characters are appended.
 */
std::string getOrCreateAlias(KeyValueStore& kv, std::string_view ns);

}  // namespace tessera
