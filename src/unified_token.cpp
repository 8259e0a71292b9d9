#include "tessera/unified_token.hpp"

#include <nlohmann/json.hpp>

#include <array>

#include "tessera/base64.hpp"
#include "tessera/byte_codec.hpp"
#include "tessera/crypto.hpp"
#include "tessera/logging.hpp"
#include "tessera/time_utils.hpp"

namespace tessera {

namespace {

constexpr size_t SIGNATURE_LENGTH = 12;
constexpr size_t MIN_TOKEN_LENGTH = 10 + SIGNATURE_LENGTH;
constexpr size_t MIN_PARSE_LENGTH = 5;

constexpr uint8_t CONSTRAINT_HAS_MAX_USES = 0x01;
constexpr uint8_t CONSTRAINT_CAN_DELEGATE = 0x02;
constexpr uint8_t CONSTRAINT_HAS_MAX_DEPTH = 0x04;

struct ResourceTypeCode {
  std::string_view name;
  uint8_t code;
};

constexpr std::array<ResourceTypeCode, 4> resource_type_codes{{
    {"kv", 0x01},
    {"blob", 0x02},
    {"channel", 0x03},
    {"namespace", 0x04},
}};

uint32_t relativeTime(int64_t unixSeconds, const char* field) {
  if (unixSeconds < TOKEN_EPOCH_SECONDS ||
      unixSeconds - TOKEN_EPOCH_SECONDS > 0xFFFFFFFFLL) {
    throw ExpiryOutOfRangeError(std::string(field) +
                                " out of range for unified token");
  }
  return static_cast<uint32_t>(unixSeconds - TOKEN_EPOCH_SECONDS);
}

void putTimes(ByteWriter& writer, int64_t issuedAt, int64_t expiresAt) {
  writer.putU32(relativeTime(issuedAt, "issuedAt"))
      .putU32(relativeTime(expiresAt, "expiresAt"));
}

void putConstraints(ByteWriter& writer, const TokenConstraints& constraints) {
  uint8_t flags = 0;
  if (constraints.maxUses) flags |= CONSTRAINT_HAS_MAX_USES;
  if (constraints.canDelegate) flags |= CONSTRAINT_CAN_DELEGATE;
  if (constraints.maxDelegationDepth) flags |= CONSTRAINT_HAS_MAX_DEPTH;

  writer.putU8(flags);
  if (constraints.maxUses) writer.putU16(*constraints.maxUses);
  if (constraints.maxDelegationDepth) {
    writer.putU8(*constraints.maxDelegationDepth);
  }
}

TokenConstraints readConstraints(ByteReader& reader) {
  TokenConstraints constraints;
  if (reader.atEnd()) return constraints;

  uint8_t flags = reader.u8();
  if (flags & CONSTRAINT_HAS_MAX_USES) {
    constraints.maxUses = reader.u16();
    constraints.requiresStateCheck = true;
  }
  if (flags & CONSTRAINT_CAN_DELEGATE) {
    constraints.canDelegate = true;
  }
  if (flags & CONSTRAINT_HAS_MAX_DEPTH) {
    constraints.maxDelegationDepth = reader.u8();
  }
  return constraints;
}

bool claimsMatchType(UnifiedTokenType type, const UnifiedClaims& claims) {
  switch (type) {
    case UnifiedTokenType::Bearer:
      return std::holds_alternative<BearerClaims>(claims);
    case UnifiedTokenType::Resource:
    case UnifiedTokenType::Share:
      return std::holds_alternative<ResourceClaims>(claims);
    case UnifiedTokenType::Invitation:
      return std::holds_alternative<InvitationClaims>(claims);
  }
  return false;
}

std::vector<uint8_t> buildPayload(const CreateUnifiedTokenParams& params,
                                  int64_t issuedAt, int64_t expiresAt) {
  if (!claimsMatchType(params.type, params.claims)) {
    throw InvalidArgumentError("Claims do not match unified token type");
  }

  ByteWriter writer(64);
  writer.putU8(UNIFIED_TOKEN_VERSION).putU8(static_cast<uint8_t>(params.type));

  std::visit(
      [&](const auto& claims) {
        using T = std::decay_t<decltype(claims)>;
        if constexpr (std::is_same_v<T, BearerClaims>) {
          writer.putU16(params.permissions);
          putTimes(writer, issuedAt, expiresAt);
          writer.putShortString(claims.identityId);
        } else if constexpr (std::is_same_v<T, ResourceClaims>) {
          writer.putU8(encodeResourceType(claims.resourceType))
              .putShortString(claims.resourceId)
              .putU16(params.permissions);
          putTimes(writer, issuedAt, expiresAt);
          writer.putShortString(claims.authorId);
          putConstraints(writer, claims.constraints);
        } else {
          const std::string capabilities =
              nlohmann::json(claims.grantedCapabilities).dump();
          writer.putU16(params.permissions);
          putTimes(writer, issuedAt, expiresAt);
          writer.putShortString(claims.identityId);
          if (capabilities.size() > 0xFFFF) {
            throw InvalidArgumentError(
                "Granted capabilities exceed 65535 bytes of JSON");
          }
          writer.putU16(static_cast<uint32_t>(capabilities.size()))
              .putBytes(asBytes(capabilities));
        }
      },
      params.claims);
  return std::move(writer).bytes();
}

std::optional<UnifiedTokenType> toTokenType(uint8_t raw) {
  switch (raw) {
    case 0x01:
      return UnifiedTokenType::Bearer;
    case 0x02:
      return UnifiedTokenType::Resource;
    case 0x03:
      return UnifiedTokenType::Share;
    case 0x04:
      return UnifiedTokenType::Invitation;
    default:
      return std::nullopt;
  }
}

std::vector<std::string> parseCapabilities(const std::string& text) {
  auto document = nlohmann::json::parse(text, nullptr, false);
  if (document.is_discarded() || !document.is_array()) {
    throw DecodeError("capabilities are not a JSON array");
  }
  std::vector<std::string> capabilities;
  for (const auto& entry : document) {
    if (!entry.is_string()) {
      throw DecodeError("capability entry is not a string");
    }
    capabilities.push_back(entry.get<std::string>());
  }
  return capabilities;
}

void readTimes(ByteReader& reader, UnifiedToken& token) {
  token.issuedAt = TOKEN_EPOCH_SECONDS + reader.u32();
  token.expiresAt = TOKEN_EPOCH_SECONDS + reader.u32();
}

UnifiedToken parsePayload(std::span<const uint8_t> payload,
                          UnifiedTokenType type) {
  ByteReader reader(payload);
  UnifiedToken token;
  token.version = reader.u8();
  reader.u8();
  token.type = type;

  switch (type) {
    case UnifiedTokenType::Bearer: {
      token.permissions = reader.u16();
      readTimes(reader, token);
      token.claims = BearerClaims{reader.shortString()};
      break;
    }
    case UnifiedTokenType::Resource:
    case UnifiedTokenType::Share: {
      ResourceClaims claims;
      claims.resourceType = decodeResourceType(reader.u8());
      claims.resourceId = reader.shortString();
      token.permissions = reader.u16();
      readTimes(reader, token);
      claims.authorId = reader.shortString();
      claims.constraints = readConstraints(reader);
      token.claims = std::move(claims);
      break;
    }
    case UnifiedTokenType::Invitation: {
      InvitationClaims claims;
      token.permissions = reader.u16();
      readTimes(reader, token);
      claims.identityId = reader.shortString();
      claims.grantedCapabilities = parseCapabilities(reader.takeString(reader.u16()));
      token.claims = std::move(claims);
      break;
    }
  }
  return token;
}

Result<UnifiedToken, TokenRejection> decodeUnchecked(std::string_view text,
                                                     std::string_view secret,
                                                     int64_t now) {
  auto bytes = base64UrlDecode(text);
  if (bytes.size() < MIN_TOKEN_LENGTH) {
    return TokenRejection::Malformed;
  }

  std::span<const uint8_t> all(bytes);
  auto payload = all.first(all.size() - SIGNATURE_LENGTH);
  if (!HmacSigner(secret).verifyTruncated(payload,
                                          all.last(SIGNATURE_LENGTH))) {
    return TokenRejection::BadSignature;
  }

  auto type = toTokenType(payload[1]);
  if (payload[0] != UNIFIED_TOKEN_VERSION || !type) {
    return TokenRejection::UnknownVersion;
  }

  UnifiedToken token = parsePayload(payload, *type);
  if (token.expiresAt < now) {
    return TokenRejection::Expired;
  }
  return token;
}

}  // namespace

uint8_t encodeResourceType(std::string_view type) noexcept {
  for (const auto& entry : resource_type_codes) {
    if (entry.name == type) return entry.code;
  }
  return 0x00;
}

std::string decodeResourceType(uint8_t code) {
  for (const auto& entry : resource_type_codes) {
    if (entry.code == code) return std::string(entry.name);
  }
  return "unknown";
}

IssuedToken createUnifiedToken(const CreateUnifiedTokenParams& params,
                               std::string_view secret) {
  return createUnifiedToken(params, secret, unixNow());
}

IssuedToken createUnifiedToken(const CreateUnifiedTokenParams& params,
                               std::string_view secret, int64_t now) {
  const int64_t expiresAt = addExpirySeconds(now, params.expiresInSeconds);
  auto payload = buildPayload(params, now, expiresAt);

  auto signature = HmacSigner(secret).signTruncated(payload, SIGNATURE_LENGTH);
  payload.insert(payload.end(), signature.begin(), signature.end());

  TESSERA_LOG_DEBUG("Issued unified token type {} expiring at {}",
                    static_cast<int>(params.type), expiresAt);
  return IssuedToken{base64UrlEncode(payload), expiresAt};
}

namespace detail {

Result<UnifiedToken, TokenRejection> decodeUnifiedToken(
    std::string_view token, std::string_view secret, int64_t now) {
  try {
    return decodeUnchecked(token, secret, now);
  } catch (const DecodeError&) {
    return TokenRejection::Malformed;
  } catch (const InvalidBase64Error&) {
    return TokenRejection::Malformed;
  }
}

}  // namespace detail

std::optional<UnifiedToken> verifyUnifiedToken(std::string_view token,
                                               std::string_view secret) {
  return verifyUnifiedToken(token, secret, unixNow());
}

std::optional<UnifiedToken> verifyUnifiedToken(std::string_view token,
                                               std::string_view secret,
                                               int64_t now) {
  auto decoded = detail::decodeUnifiedToken(token, secret, now);
  if (!decoded) {
    TESSERA_LOG_DEBUG("Rejected unified token: {}",
                      tokenRejectionToString(decoded.error()));
    return std::nullopt;
  }
  return std::move(decoded).value();
}

std::optional<ParsedUnifiedToken> parseUnifiedToken(std::string_view token) {
  std::vector<uint8_t> bytes;
  try {
    bytes = base64UrlDecode(token);
  } catch (const InvalidBase64Error&) {
    return std::nullopt;
  }
  if (bytes.size() < MIN_PARSE_LENGTH) {
    return std::nullopt;
  }
  auto type = toTokenType(bytes[1]);
  if (!type) {
    return std::nullopt;
  }

  ParsedUnifiedToken parsed;
  parsed.version = bytes[0];
  parsed.type = *type;
  if (*type == UnifiedTokenType::Resource || *type == UnifiedTokenType::Share) {
    parsed.resourceType = decodeResourceType(bytes[2]);
    size_t idLength = bytes[3];
    if (bytes.size() >= 4 + idLength) {
      parsed.resourceId = std::string(bytes.begin() + 4,
                                      bytes.begin() + 4 + idLength);
    }
  }
  return parsed;
}

}  // namespace tessera
