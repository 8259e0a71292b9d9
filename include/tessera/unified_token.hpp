/**
 * @file unified_token.hpp
 * @brief Single envelope for bearer, resource, share and invitation tokens
 *
 * Layout: version(1)=0x01 type(1) <type fields> signature(12). Times are
 * uint32 seconds relative to 2024-01-01T00:00:00Z.
 *
 *   BEARER      perm(2) issued(4) expires(4) idLen(1) identityId
 *   RESOURCE,   resType(1) idLen(1) resourceId perm(2) issued(4) expires(4)
 *   SHARE       authorLen(1) authorId flags(1) [maxUses(2)] [maxDepth(1)]
 *
 *   INVITATION  perm(2) issued(4) expires(4) idLen(1) identityId
 *               capLen(2) capabilities as a JSON array
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "error.hpp"
#include "resource_token.hpp"

namespace tessera {

enum class UnifiedTokenType : uint8_t {
  Bearer = 0x01,
  Resource = 0x02,
  Share = 0x03,
  Invitation = 0x04
};

/// Low byte: common permissions. High byte reserved for resource-specific bits.
namespace unified_permission {
constexpr uint16_t READ = 0x01;
constexpr uint16_t WRITE = 0x02;
constexpr uint16_t DELETE = 0x04;
constexpr uint16_t LIST = 0x08;
constexpr uint16_t ADMIN = 0x10;
constexpr uint16_t SHARE = 0x20;
constexpr uint16_t DELEGATE = 0x40;
}  // namespace unified_permission

constexpr uint8_t UNIFIED_TOKEN_VERSION = 0x01;

/**
 * @brief Optional limits, encoded as a flags byte plus only the present values
 */
struct TokenConstraints {
  std::optional<uint16_t> maxUses;
  bool canDelegate = false;
  std::optional<uint8_t> maxDelegationDepth;
  /// Set on decode when maxUses is present; use counting needs server state
  bool requiresStateCheck = false;

  bool operator==(const TokenConstraints&) const = default;
};

struct BearerClaims {
  std::string identityId;
};

/// Claims for both RESOURCE and SHARE tokens
struct ResourceClaims {
  std::string resourceType;  ///< kv, blob, channel or namespace
  std::string resourceId;
  std::string authorId;
  TokenConstraints constraints;
};

struct InvitationClaims {
  std::string identityId;
  std::vector<std::string> grantedCapabilities;
};

using UnifiedClaims = std::variant<BearerClaims, ResourceClaims, InvitationClaims>;

struct CreateUnifiedTokenParams {
  UnifiedTokenType type = UnifiedTokenType::Bearer;
  uint16_t permissions = 0;
  int64_t expiresInSeconds = 0;
  UnifiedClaims claims;
};

struct UnifiedToken {
  uint8_t version = UNIFIED_TOKEN_VERSION;
  UnifiedTokenType type = UnifiedTokenType::Bearer;
  uint16_t permissions = 0;
  int64_t issuedAt = 0;
  int64_t expiresAt = 0;
  UnifiedClaims claims;
};

struct ParsedUnifiedToken {
  uint8_t version = UNIFIED_TOKEN_VERSION;
  UnifiedTokenType type = UnifiedTokenType::Bearer;
  std::optional<std::string> resourceType;
  std::optional<std::string> resourceId;
};

/**
 * @brief Issue a unified token
 * @throws InvalidArgumentError if the claims do not match the type or a
 *         string exceeds its length prefix
 * @throws ExpiryOutOfRangeError if a time does not fit the uint32 field
 */
IssuedToken createUnifiedToken(const CreateUnifiedTokenParams& params,
                               std::string_view secret);
IssuedToken createUnifiedToken(const CreateUnifiedTokenParams& params,
                               std::string_view secret, int64_t now);

/**
 * @brief Verify signature and expiry; nullopt on any failure
 */
std::optional<UnifiedToken> verifyUnifiedToken(std::string_view token,
                                               std::string_view secret);
std::optional<UnifiedToken> verifyUnifiedToken(std::string_view token,
                                               std::string_view secret,
                                               int64_t now);

/**
 * @brief Read type and, for resource/share tokens, the resource reference
 *        without checking the signature
 */
std::optional<ParsedUnifiedToken> parseUnifiedToken(std::string_view token);

uint8_t encodeResourceType(std::string_view type) noexcept;
std::string decodeResourceType(uint8_t code);

namespace detail {

Result<UnifiedToken, TokenRejection> decodeUnifiedToken(
    std::string_view token, std::string_view secret, int64_t now);

}  // namespace detail

}  // namespace tessera
