#include "tessera/grants.hpp"

#include <algorithm>
#include <iterator>

#include "tessera/crypto.hpp"
#include "tessera/error.hpp"
#include "tessera/logging.hpp"

namespace tessera {

namespace {

using NamespaceSet = std::set<std::string>;

void narrowCapabilities(
    std::map<std::string, std::optional<NamespaceSet>, std::less<>>& access,
    const std::vector<std::string>& allowed) {
  for (auto it = access.begin(); it != access.end();) {
    if (std::find(allowed.begin(), allowed.end(), it->first) == allowed.end()) {
      it = access.erase(it);
    } else {
      ++it;
    }
  }
}

void narrowNamespaces(
    std::map<std::string, std::optional<NamespaceSet>, std::less<>>& access,
    const std::vector<std::string>& allowed) {
  NamespaceSet allowedSet(allowed.begin(), allowed.end());
  for (auto& [capability, namespaces] : access) {
    if (!namespaces) {
      namespaces = allowedSet;
      continue;
    }
    NamespaceSet kept;
    std::set_intersection(namespaces->begin(), namespaces->end(),
                          allowedSet.begin(), allowedSet.end(),
                          std::inserter(kept, kept.end()));
    namespaces = std::move(kept);
  }
}

}  // namespace

std::string_view grantSourceToString(GrantSource source) noexcept {
  switch (source) {
    case GrantSource::Direct:
      return "direct";
    case GrantSource::Invitation:
      return "invitation";
    case GrantSource::Delegation:
      return "delegation";
    case GrantSource::System:
      return "system";
  }
  return "direct";
}

std::optional<GrantSource> grantSourceFromString(std::string_view text) {
  for (auto source : {GrantSource::Direct, GrantSource::Invitation,
                      GrantSource::Delegation, GrantSource::System}) {
    if (grantSourceToString(source) == text) return source;
  }
  return std::nullopt;
}

CapabilityGrant createGrant(const CreateGrantParams& params) {
  if (params.identityId.empty()) {
    throw InvalidArgumentError("identityId is required");
  }
  if (params.capability.empty()) {
    throw InvalidArgumentError("capability is required");
  }
  if (params.grantedBy.empty()) {
    throw InvalidArgumentError("grantedBy is required");
  }

  CapabilityGrant grant;
  grant.grantId = "grant_" + randomHex(16);
  grant.identityId = params.identityId;
  grant.capability = params.capability;
  grant.grantedAt = Clock::now();
  grant.grantedBy = params.grantedBy;
  grant.source = params.source;
  grant.sourceId = params.sourceId;
  grant.scope = params.scope;
  grant.expiresAt = params.expiresAt;

  TESSERA_LOG_DEBUG("Granted {} to {} ({})", grant.capability, grant.identityId,
                    grantSourceToString(grant.source));
  return grant;
}

CapabilityGrant revokeGrant(const CapabilityGrant& grant, std::string revokedBy,
                            std::optional<std::string> reason) {
  if (grant.revokedAt) {
    return grant;
  }
  CapabilityGrant revoked = grant;
  revoked.revokedAt = Clock::now();
  revoked.revokedBy = std::move(revokedBy);
  revoked.revocationReason = std::move(reason);
  return revoked;
}

bool isGrantValid(const CapabilityGrant& grant) {
  return isGrantValid(grant, Clock::now());
}

bool isGrantValid(const CapabilityGrant& grant, Timestamp now) {
  if (grant.revokedAt) {
    return false;
  }
  return !(grant.expiresAt && now > *grant.expiresAt);
}

std::vector<std::string> EffectivePermissions::capabilities() const {
  std::vector<std::string> result;
  result.reserve(access_.size());
  for (const auto& entry : access_) {
    result.push_back(entry.first);
  }
  return result;
}

std::vector<std::string> EffectivePermissions::namespaces() const {
  NamespaceSet all;
  for (const auto& [capability, namespaces] : access_) {
    if (namespaces) {
      all.insert(namespaces->begin(), namespaces->end());
    }
  }
  return {all.begin(), all.end()};
}

bool EffectivePermissions::hasCapability(std::string_view capability) const {
  return access_.find(capability) != access_.end();
}

bool EffectivePermissions::canAccessNamespace(std::string_view ns) const {
  for (const auto& entry : access_) {
    if (canAccessNamespace(ns, entry.first)) return true;
  }
  return false;
}

bool EffectivePermissions::canAccessNamespace(
    std::string_view ns, std::string_view capability) const {
  auto it = access_.find(capability);
  if (it == access_.end()) {
    return false;
  }
  const auto& namespaces = it->second;
  return !namespaces || namespaces->count(std::string(ns)) > 0;
}

bool EffectivePermissions::canAccessResource(std::string_view type,
                                             std::string_view id) const {
  if (resources_.empty()) {
    return true;
  }
  return std::any_of(resources_.begin(), resources_.end(),
                     [&](const ResourceRef& r) {
                       return r.type == type && r.id == id;
                     });
}

bool EffectivePermissions::canAccessKey(std::string_view key) const {
  if (keyPatterns_.empty()) {
    return true;
  }
  return keyPatterns_.matches(key);
}

EffectivePermissions resolveEffectivePermissions(
    const std::vector<CapabilityGrant>& grants,
    const std::optional<CredentialScope>& credentialScope,
    const std::optional<TokenClaims>& tokenClaims) {
  return resolveEffectivePermissions(grants, credentialScope, tokenClaims,
                                     Clock::now());
}

EffectivePermissions resolveEffectivePermissions(
    const std::vector<CapabilityGrant>& grants,
    const std::optional<CredentialScope>& credentialScope,
    const std::optional<TokenClaims>& tokenClaims, Timestamp now) {
  EffectivePermissions effective;
  auto& access = effective.access_;

  for (const auto& grant : grants) {
    if (!isGrantValid(grant, now)) continue;

    const bool restricted = grant.scope && grant.scope->namespaces;
    auto [it, inserted] = access.try_emplace(grant.capability);
    if (!restricted) {
      it->second.reset();
    } else if (inserted || it->second) {
      if (!it->second) it->second.emplace();
      it->second->insert(grant.scope->namespaces->begin(),
                         grant.scope->namespaces->end());
    }

    if (!grant.scope) continue;
    if (grant.scope->resources) {
      for (const auto& resource : *grant.scope->resources) {
        if (std::find(effective.resources_.begin(), effective.resources_.end(),
                      resource) == effective.resources_.end()) {
          effective.resources_.push_back(resource);
        }
      }
    }
    if (grant.scope->keyPatterns) {
      for (const auto& pattern : *grant.scope->keyPatterns) {
        effective.keyPatterns_.addPattern(pattern);
      }
    }
  }

  if (credentialScope) {
    if (credentialScope->capabilities) {
      narrowCapabilities(access, *credentialScope->capabilities);
    }
    if (credentialScope->namespaces) {
      narrowNamespaces(access, *credentialScope->namespaces);
    }
  }
  if (tokenClaims) {
    if (tokenClaims->capabilities) {
      narrowCapabilities(access, *tokenClaims->capabilities);
    }
    if (tokenClaims->namespaces) {
      narrowNamespaces(access, *tokenClaims->namespaces);
    }
  }
  return effective;
}

}  // namespace tessera
