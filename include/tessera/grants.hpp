/**
 * @file grants.hpp
 * @brief Capability grants and their resolution into effective permissions
 */

#pragma once

#include <compare>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "credential.hpp"
#include "key_patterns.hpp"
#include "time_utils.hpp"

namespace tessera {

enum class GrantSource { Direct, Invitation, Delegation, System };

std::string_view grantSourceToString(GrantSource source) noexcept;
std::optional<GrantSource> grantSourceFromString(std::string_view text);

struct ResourceRef {
  std::string type;
  std::string id;

  auto operator<=>(const ResourceRef&) const = default;
};

/**
 * @brief Narrowing of a single grant; every absent list is unrestricted
 */
struct GrantScope {
  std::optional<std::vector<std::string>> namespaces;
  std::optional<std::vector<ResourceRef>> resources;
  std::optional<std::vector<std::string>> keyPatterns;
};

struct CapabilityGrant {
  std::string grantId;  ///< grant_<32 hex>
  std::string identityId;
  std::string capability;
  Timestamp grantedAt;
  std::string grantedBy;
  GrantSource source = GrantSource::Direct;
  std::optional<std::string> sourceId;
  std::optional<GrantScope> scope;
  std::optional<Timestamp> expiresAt;
  std::optional<Timestamp> revokedAt;
  std::optional<std::string> revokedBy;
  std::optional<std::string> revocationReason;
};

struct CreateGrantParams {
  std::string identityId;
  std::string capability;
  std::string grantedBy;
  GrantSource source = GrantSource::Direct;
  std::optional<std::string> sourceId;
  std::optional<GrantScope> scope;
  std::optional<Timestamp> expiresAt;
};

/**
 * @throws InvalidArgumentError if identityId, capability or grantedBy is empty
 */
CapabilityGrant createGrant(const CreateGrantParams& params);

/**
 * @brief Copy with the revocation fields set; an already revoked grant is
 *        returned unchanged
 */
CapabilityGrant revokeGrant(const CapabilityGrant& grant, std::string revokedBy,
                            std::optional<std::string> reason = std::nullopt);

/**
 * @brief Not revoked and, when an expiry is set, not past it
 */
bool isGrantValid(const CapabilityGrant& grant);
bool isGrantValid(const CapabilityGrant& grant, Timestamp now);

/**
 * @brief Token-level restriction applied after the credential scope
 */
struct TokenClaims {
  std::optional<std::vector<std::string>> capabilities;
  std::optional<std::vector<std::string>> namespaces;
};

/**
 * @brief The access actually granted once grants, credential scope and token
 *        claims have been combined
 */
class EffectivePermissions {
 public:
  /// Capabilities in sorted order
  std::vector<std::string> capabilities() const;

  /// Every namespace named by a restricted capability; empty when none is
  std::vector<std::string> namespaces() const;

  /// Deduplicated resource allow-list; empty means unrestricted
  const std::vector<ResourceRef>& resources() const noexcept {
    return resources_;
  }

  bool hasCapability(std::string_view capability) const;

  /**
   * @brief Namespace visible through at least one capability
   */
  bool canAccessNamespace(std::string_view ns) const;

  /**
   * @brief Namespace visible through this particular capability
   */
  bool canAccessNamespace(std::string_view ns,
                          std::string_view capability) const;

  bool canAccessResource(std::string_view type, std::string_view id) const;

  bool canAccessKey(std::string_view key) const;

 private:
  friend EffectivePermissions resolveEffectivePermissions(
      const std::vector<CapabilityGrant>&, const std::optional<CredentialScope>&,
      const std::optional<TokenClaims>&, Timestamp);

  /// Per capability; nullopt = any namespace
  std::map<std::string, std::optional<std::set<std::string>>, std::less<>>
      access_;
  std::vector<ResourceRef> resources_;
  KeyPatternMatcher keyPatterns_;
};

/**
 * @brief Combine valid grants with optional credential and token restrictions
 *
 * Capabilities are the union over valid grants, intersected with the
 * credential scope's capabilities and then with the token's. A capability
 * reaches every namespace if any contributing grant leaves namespaces
 * unrestricted; otherwise the union of the grants' namespaces. Namespace
 * lists in the credential scope and token claims narrow that further.
 */
EffectivePermissions resolveEffectivePermissions(
    const std::vector<CapabilityGrant>& grants,
    const std::optional<CredentialScope>& credentialScope = std::nullopt,
    const std::optional<TokenClaims>& tokenClaims = std::nullopt);
EffectivePermissions resolveEffectivePermissions(
    const std::vector<CapabilityGrant>& grants,
    const std::optional<CredentialScope>& credentialScope,
    const std::optional<TokenClaims>& tokenClaims, Timestamp now);

}  // namespace tessera
