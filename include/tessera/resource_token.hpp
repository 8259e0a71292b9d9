/**
 * @file resource_token.hpp
 * @brief Stateless, per-resource capability tokens for channels and logs
 *
 * Four wire formats coexist. The first byte (or a literal "ey" prefix for
 * the legacy JSON form) together with the decoded length identifies the
 * format:
 *
 *   V1  base64url(JSON {l, g, p, a, e, s})                   verify only
 *   V2  ver(1) id(8) perm(1) author(4) expiry(4 abs) sig(16)  34 bytes
 *   V3  ver(1) id(6) perm(1) author(2) expiry(3 hrs) sig(12)  25 bytes
 *   V4  ver(1) id(6) perm(1) len(1) author(1..32) expiry(3 hrs) sig(12)
 *
 * V3/V4 expiry is counted in whole hours since 2024-01-01T00:00:00Z, so a
 * verified expiry is the issued one rounded down to the hour.
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "error.hpp"

namespace tessera {

enum class ResourceKind : uint8_t { Channel, Log };

constexpr std::string_view resourceKindToString(ResourceKind kind) noexcept {
  return kind == ResourceKind::Log ? "log" : "channel";
}

enum class FormatTag : uint8_t { V1 = 1, V2 = 2, V3 = 3, V4 = 4 };

/// Resource-generic permission bitmap
namespace permission_bits {
constexpr uint8_t READ = 0x01;
constexpr uint8_t APPEND = 0x02;  ///< legacy "write"
constexpr uint8_t READ_DELETED = 0x04;
constexpr uint8_t DELETE_OWN = 0x08;
constexpr uint8_t DELETE_ANY = 0x10;
constexpr uint8_t LEGACY_MASK = READ | APPEND;
}  // namespace permission_bits

/**
 * @brief Fold permission names into a bitmap
 * @throws InvalidArgumentError on an unknown permission name
 */
uint8_t permissionsToBitmap(const std::vector<std::string>& permissions);

/**
 * @brief Expand a bitmap into permission names, in bit order
 */
std::vector<std::string> bitmapToPermissions(uint8_t bitmap);

constexpr size_t MAX_AUTHOR_NAME_BYTES = 32;

struct CreateResourceTokenParams {
  ResourceKind kind = ResourceKind::Channel;
  std::string resourceId;
  std::vector<std::string> permissions;
  std::optional<std::string> authorId;
  std::optional<std::string> displayName;  ///< becomes the V4 author name
  int64_t expiresInSeconds = 0;
};

struct IssuedToken {
  std::string token;
  int64_t expiresAt = 0;  ///< now + expiresInSeconds, not rounded
};

struct VerifiedResourceToken {
  std::string resourceId;
  ResourceKind resourceType = ResourceKind::Channel;
  std::vector<std::string> permissions;
  std::string authorId;
  int64_t expiresAt = 0;
  FormatTag format = FormatTag::V3;
};

struct ParsedResourceToken {
  std::string resourceId;
  ResourceKind resourceType = ResourceKind::Channel;
  FormatTag format = FormatTag::V3;
};

/**
 * @brief Pick the wire format a create call will emit
 *
 * Logs always use V2. Channels use V4 when a display name is given or a
 * permission outside read/append is requested, otherwise V3.
 */
FormatTag selectFormat(const CreateResourceTokenParams& params);

/**
 * @brief Issue a signed token
 * @param params Resource, permissions, author and lifetime
 * @param secret The resource's signing secret
 * @return Encoded token and its unrounded expiry
 * @throws InvalidArgumentError for empty/oversize author names, unknown
 *         permissions or non-hex identifiers
 * @throws ExpiryOutOfRangeError if the expiry does not fit the format
 */
IssuedToken createResourceToken(const CreateResourceTokenParams& params,
                                std::string_view secret);
IssuedToken createResourceToken(const CreateResourceTokenParams& params,
                                std::string_view secret, int64_t now);

inline IssuedToken createChannelToken(CreateResourceTokenParams params,
                                      std::string_view secret) {
  params.kind = ResourceKind::Channel;
  return createResourceToken(params, secret);
}

inline IssuedToken createLogToken(CreateResourceTokenParams params,
                                  std::string_view secret) {
  params.kind = ResourceKind::Log;
  return createResourceToken(params, secret);
}

/**
 * @brief Verify signature and expiry of a presented token
 *
 * Channels accept V1 through V4, logs accept V1 and V2. Every failure
 * (malformed, unknown version, bad signature, expired) yields nullopt.
 */
std::optional<VerifiedResourceToken> verifyResourceToken(
    std::string_view token, std::string_view secret, ResourceKind kind);
std::optional<VerifiedResourceToken> verifyResourceToken(
    std::string_view token, std::string_view secret, ResourceKind kind,
    int64_t now);

/**
 * @brief Extract the resource id without checking the signature
 *
 * Used to look up the per-resource secret before calling
 * verifyResourceToken.
 */
std::optional<ParsedResourceToken> parseResourceToken(std::string_view token,
                                                      ResourceKind kind);

namespace detail {

struct LegacyJsonToken {
  std::string resourceId;
  std::string gateway;
  std::vector<std::string> permissions;
  std::string authorId;
  int64_t expiresAt = 0;
};

struct BinaryTokenV2 {
  std::array<uint8_t, 8> resourceId{};
  uint8_t permissions = 0;
  std::array<uint8_t, 4> authorId{};
  uint32_t expiresAt = 0;
};

struct CompactTokenV3 {
  std::array<uint8_t, 6> resourceId{};
  uint8_t permissions = 0;
  std::array<uint8_t, 2> authorId{};
  uint32_t expiryHours = 0;
};

struct NamedTokenV4 {
  std::array<uint8_t, 6> resourceId{};
  uint8_t permissions = 0;
  std::string authorName;
  uint32_t expiryHours = 0;
};

using DecodedResourceToken =
    std::variant<LegacyJsonToken, BinaryTokenV2, CompactTokenV3, NamedTokenV4>;

/**
 * @brief Signature- and expiry-checked decode, keeping the rejection reason
 */
Result<DecodedResourceToken, TokenRejection> decodeResourceToken(
    std::string_view token, std::string_view secret, ResourceKind kind,
    int64_t now);

VerifiedResourceToken normalize(const DecodedResourceToken& decoded,
                                ResourceKind kind);

}  // namespace detail

}  // namespace tessera
