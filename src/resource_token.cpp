#include "tessera/resource_token.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>

#include "tessera/base64.hpp"
#include "tessera/byte_codec.hpp"
#include "tessera/crypto.hpp"
#include "tessera/logging.hpp"
#include "tessera/secure_vector.hpp"
#include "tessera/time_utils.hpp"

namespace tessera {

namespace {

constexpr uint8_t VERSION_V2 = 0x02;
constexpr uint8_t VERSION_V3 = 0x03;
constexpr uint8_t VERSION_V4 = 0x04;

constexpr size_t V2_PAYLOAD = 18;
constexpr size_t V2_SIGNATURE = 16;
constexpr size_t V3_PAYLOAD = 13;
constexpr size_t COMPACT_SIGNATURE = 12;
constexpr size_t V4_FIXED_PAYLOAD = 12;  // everything but the author name
constexpr size_t V4_MIN_TOTAL = V4_FIXED_PAYLOAD + 1 + COMPACT_SIGNATURE;
constexpr size_t V4_MAX_TOTAL =
    V4_FIXED_PAYLOAD + MAX_AUTHOR_NAME_BYTES + COMPACT_SIGNATURE;

constexpr int64_t SECONDS_PER_HOUR = 3600;

struct PermissionName {
  std::string_view name;
  uint8_t bit;
};

constexpr std::array<PermissionName, 5> permission_names{{
    {"read", permission_bits::READ},
    {"append", permission_bits::APPEND},
    {"read:deleted", permission_bits::READ_DELETED},
    {"delete:own", permission_bits::DELETE_OWN},
    {"delete:any", permission_bits::DELETE_ANY},
}};

using TokenResult = Result<detail::DecodedResourceToken, TokenRejection>;

template <size_t N>
std::array<uint8_t, N> toArray(std::span<const uint8_t> bytes) {
  std::array<uint8_t, N> out{};
  std::copy_n(bytes.begin(), N, out.begin());
  return out;
}

uint32_t hoursSinceEpoch(int64_t expiresAt, FormatTag format) {
  if (expiresAt < TOKEN_EPOCH_SECONDS ||
      (expiresAt - TOKEN_EPOCH_SECONDS) / SECONDS_PER_HOUR > 0xFFFFFF) {
    throw ExpiryOutOfRangeError(
        std::string("Expiry time out of range for V") +
        std::to_string(static_cast<int>(format)) + " token");
  }
  return static_cast<uint32_t>((expiresAt - TOKEN_EPOCH_SECONDS) /
                               SECONDS_PER_HOUR);
}

int64_t hoursToUnix(uint32_t hours) {
  return TOKEN_EPOCH_SECONDS + static_cast<int64_t>(hours) * SECONDS_PER_HOUR;
}

std::string resolveAuthor(const CreateResourceTokenParams& params) {
  if (params.displayName) return *params.displayName;
  if (params.authorId && !params.authorId->empty()) return *params.authorId;
  return randomHex(2);
}

std::string finish(std::vector<uint8_t> payload, std::string_view secret,
                   size_t signatureLength) {
  HmacSigner signer(secret);
  auto signature = signer.signTruncated(payload, signatureLength);
  payload.insert(payload.end(), signature.begin(), signature.end());
  return base64UrlEncode(payload);
}

std::string encodeV2(const CreateResourceTokenParams& params,
                     const std::string& author, uint8_t perms,
                     int64_t expiresAt, std::string_view secret) {
  if (expiresAt < 0 || expiresAt > 0xFFFFFFFFLL) {
    throw ExpiryOutOfRangeError("Expiry time out of range for V2 token");
  }
  ByteWriter writer(V2_PAYLOAD + V2_SIGNATURE);
  writer.putU8(VERSION_V2)
      .putBytes(hexToFixedBytes(params.resourceId, 8))
      .putU8(perms)
      .putBytes(hexToFixedBytes(author, 4))
      .putU32(static_cast<uint64_t>(expiresAt));
  return finish(std::move(writer).bytes(), secret, V2_SIGNATURE);
}

std::string encodeV3(const CreateResourceTokenParams& params,
                     const std::string& author, uint8_t perms,
                     int64_t expiresAt, std::string_view secret) {
  uint32_t hours = hoursSinceEpoch(expiresAt, FormatTag::V3);
  ByteWriter writer(V3_PAYLOAD + COMPACT_SIGNATURE);
  writer.putU8(VERSION_V3)
      .putBytes(hexToFixedBytes(params.resourceId, 6))
      .putU8(perms)
      .putBytes(hexToFixedBytes(author, 2))
      .putU24(hours);
  return finish(std::move(writer).bytes(), secret, COMPACT_SIGNATURE);
}

std::string encodeV4(const CreateResourceTokenParams& params,
                     const std::string& author, uint8_t perms,
                     int64_t expiresAt, std::string_view secret) {
  if (author.empty()) {
    throw InvalidArgumentError("Author name cannot be empty");
  }
  if (author.size() > MAX_AUTHOR_NAME_BYTES) {
    throw InvalidArgumentError("Author name too long (max 32 bytes UTF-8)");
  }
  uint32_t hours = hoursSinceEpoch(expiresAt, FormatTag::V4);
  ByteWriter writer(V4_FIXED_PAYLOAD + author.size() + COMPACT_SIGNATURE);
  writer.putU8(VERSION_V4)
      .putBytes(hexToFixedBytes(params.resourceId, 6))
      .putU8(perms)
      .putShortString(author)
      .putU24(hours);
  return finish(std::move(writer).bytes(), secret, COMPACT_SIGNATURE);
}

// Splits payload and signature, checks the signature in constant time
bool signatureMatches(std::span<const uint8_t> bytes, size_t signatureLength,
                      std::string_view secret) {
  auto payload = bytes.first(bytes.size() - signatureLength);
  auto signature = bytes.last(signatureLength);
  return HmacSigner(secret).verifyTruncated(payload, signature);
}

TokenResult decodeV1(std::string_view token, std::string_view secret,
                     int64_t now) {
  auto raw = base64UrlDecode(token);
  auto document = nlohmann::ordered_json::parse(raw.begin(), raw.end(),
                                                nullptr, false);
  if (document.is_discarded() || !document.is_object()) {
    return TokenRejection::Malformed;
  }

  const auto l = document.find("l");
  const auto p = document.find("p");
  const auto e = document.find("e");
  const auto s = document.find("s");
  if (l == document.end() || !l->is_string() || p == document.end() ||
      !p->is_array() || e == document.end() || !e->is_number_integer() ||
      s == document.end() || !s->is_string()) {
    return TokenRejection::Malformed;
  }

  detail::LegacyJsonToken legacy;
  legacy.resourceId = l->get<std::string>();
  legacy.expiresAt = e->get<int64_t>();
  legacy.gateway = document.value("g", std::string());
  legacy.authorId = document.value("a", std::string());

  if (legacy.expiresAt < now) {
    return TokenRejection::Expired;
  }

  const std::string provided = s->get<std::string>();
  auto unsigned_document = document;
  unsigned_document.erase("s");
  const std::string canonical = unsigned_document.dump();
  const std::string expected =
      base64UrlEncode(HmacSigner(secret).sign(asBytes(canonical)));
  if (!secure_utils::constantTimeEqual(provided, expected)) {
    return TokenRejection::BadSignature;
  }

  for (const auto& entry : *p) {
    legacy.permissions.push_back(
        entry.is_string() && entry.get<std::string>() == "r" ? "read"
                                                             : "append");
  }
  return detail::DecodedResourceToken{std::move(legacy)};
}

TokenResult decodeV2(std::span<const uint8_t> bytes, std::string_view secret,
                     int64_t now) {
  if (!signatureMatches(bytes, V2_SIGNATURE, secret)) {
    return TokenRejection::BadSignature;
  }
  ByteReader reader(bytes.first(V2_PAYLOAD));
  reader.u8();
  detail::BinaryTokenV2 token;
  token.resourceId = toArray<8>(reader.take(8));
  token.permissions = reader.u8();
  token.authorId = toArray<4>(reader.take(4));
  token.expiresAt = reader.u32();
  if (static_cast<int64_t>(token.expiresAt) < now) {
    return TokenRejection::Expired;
  }
  return detail::DecodedResourceToken{token};
}

TokenResult decodeV3(std::span<const uint8_t> bytes, std::string_view secret,
                     int64_t now) {
  if (!signatureMatches(bytes, COMPACT_SIGNATURE, secret)) {
    return TokenRejection::BadSignature;
  }
  ByteReader reader(bytes.first(V3_PAYLOAD));
  reader.u8();
  detail::CompactTokenV3 token;
  token.resourceId = toArray<6>(reader.take(6));
  token.permissions = reader.u8();
  token.authorId = toArray<2>(reader.take(2));
  token.expiryHours = reader.u24();
  if (hoursToUnix(token.expiryHours) < now) {
    return TokenRejection::Expired;
  }
  return detail::DecodedResourceToken{token};
}

// Length must agree with the embedded author length before anything is signed
bool isWellFormedV4(std::span<const uint8_t> bytes) {
  if (bytes.size() < V4_MIN_TOTAL || bytes.size() > V4_MAX_TOTAL) {
    return false;
  }
  size_t authorLength = bytes[8];
  if (authorLength < 1 || authorLength > MAX_AUTHOR_NAME_BYTES) {
    return false;
  }
  return bytes.size() ==
         V4_FIXED_PAYLOAD + authorLength + COMPACT_SIGNATURE;
}

TokenResult decodeV4(std::span<const uint8_t> bytes, std::string_view secret,
                     int64_t now) {
  if (!isWellFormedV4(bytes)) {
    return TokenRejection::Malformed;
  }
  if (!signatureMatches(bytes, COMPACT_SIGNATURE, secret)) {
    return TokenRejection::BadSignature;
  }
  ByteReader reader(bytes.first(bytes.size() - COMPACT_SIGNATURE));
  reader.u8();
  detail::NamedTokenV4 token;
  token.resourceId = toArray<6>(reader.take(6));
  token.permissions = reader.u8();
  token.authorName = reader.shortString();
  token.expiryHours = reader.u24();
  if (hoursToUnix(token.expiryHours) < now) {
    return TokenRejection::Expired;
  }
  return detail::DecodedResourceToken{std::move(token)};
}

bool isLegacyJson(std::string_view token) {
  return token.size() >= 2 && token.substr(0, 2) == "ey";
}

// Version sniffing by first byte and total length
std::optional<FormatTag> detectBinaryFormat(std::span<const uint8_t> bytes,
                                            ResourceKind kind) {
  if (bytes.empty()) return std::nullopt;
  if (kind == ResourceKind::Channel) {
    if (bytes[0] == VERSION_V4) return FormatTag::V4;
    if (bytes.size() == V3_PAYLOAD + COMPACT_SIGNATURE &&
        bytes[0] == VERSION_V3) {
      return FormatTag::V3;
    }
  }
  if (bytes.size() == V2_PAYLOAD + V2_SIGNATURE && bytes[0] == VERSION_V2) {
    return FormatTag::V2;
  }
  return std::nullopt;
}

TokenResult decodeUnchecked(std::string_view token, std::string_view secret,
                            ResourceKind kind, int64_t now) {
  if (isLegacyJson(token)) {
    return decodeV1(token, secret, now);
  }
  auto bytes = base64UrlDecode(token);
  auto format = detectBinaryFormat(bytes, kind);
  if (!format) {
    return TokenRejection::UnknownVersion;
  }
  switch (*format) {
    case FormatTag::V2:
      return decodeV2(bytes, secret, now);
    case FormatTag::V3:
      return decodeV3(bytes, secret, now);
    case FormatTag::V4:
      return decodeV4(bytes, secret, now);
    case FormatTag::V1:
      break;
  }
  return TokenRejection::UnknownVersion;
}

}  // namespace

uint8_t permissionsToBitmap(const std::vector<std::string>& permissions) {
  uint8_t bitmap = 0;
  for (const auto& permission : permissions) {
    if (permission == "write") {
      bitmap |= permission_bits::APPEND;
      continue;
    }
    auto it = std::find_if(
        permission_names.begin(), permission_names.end(),
        [&](const PermissionName& p) { return p.name == permission; });
    if (it == permission_names.end()) {
      throw InvalidArgumentError("Unknown permission: " + permission);
    }
    bitmap |= it->bit;
  }
  return bitmap;
}

std::vector<std::string> bitmapToPermissions(uint8_t bitmap) {
  std::vector<std::string> permissions;
  for (const auto& p : permission_names) {
    if (bitmap & p.bit) {
      permissions.emplace_back(p.name);
    }
  }
  return permissions;
}

FormatTag selectFormat(const CreateResourceTokenParams& params) {
  if (params.kind == ResourceKind::Log) {
    return FormatTag::V2;
  }
  if (params.displayName) {
    return FormatTag::V4;
  }
  uint8_t bitmap = permissionsToBitmap(params.permissions);
  return (bitmap & ~permission_bits::LEGACY_MASK) ? FormatTag::V4
                                                   : FormatTag::V3;
}

IssuedToken createResourceToken(const CreateResourceTokenParams& params,
                                std::string_view secret) {
  return createResourceToken(params, secret, unixNow());
}

IssuedToken createResourceToken(const CreateResourceTokenParams& params,
                                std::string_view secret, int64_t now) {
  const FormatTag format = selectFormat(params);
  const uint8_t perms = permissionsToBitmap(params.permissions);
  const std::string author = resolveAuthor(params);
  const int64_t expiresAt = addExpirySeconds(now, params.expiresInSeconds);

  IssuedToken issued;
  issued.expiresAt = expiresAt;
  switch (format) {
    case FormatTag::V2:
      issued.token = encodeV2(params, author, perms, expiresAt, secret);
      break;
    case FormatTag::V3:
      issued.token = encodeV3(params, author, perms, expiresAt, secret);
      break;
    case FormatTag::V4:
      issued.token = encodeV4(params, author, perms, expiresAt, secret);
      break;
    case FormatTag::V1:
      throw InvalidArgumentError("Legacy JSON tokens cannot be issued");
  }
  TESSERA_LOG_DEBUG("Issued V{} {} token for {} expiring at {}",
                    static_cast<int>(format), resourceKindToString(params.kind),
                    params.resourceId, expiresAt);
  return issued;
}

namespace detail {

Result<DecodedResourceToken, TokenRejection> decodeResourceToken(
    std::string_view token, std::string_view secret, ResourceKind kind,
    int64_t now) {
  try {
    return decodeUnchecked(token, secret, kind, now);
  } catch (const DecodeError&) {
    return TokenRejection::Malformed;
  } catch (const InvalidBase64Error&) {
    return TokenRejection::Malformed;
  } catch (const nlohmann::json::exception&) {
    return TokenRejection::Malformed;
  }
}

VerifiedResourceToken normalize(const DecodedResourceToken& decoded,
                                ResourceKind kind) {
  VerifiedResourceToken out;
  out.resourceType = kind;
  std::visit(
      [&out](const auto& token) {
        using T = std::decay_t<decltype(token)>;
        if constexpr (std::is_same_v<T, LegacyJsonToken>) {
          out.resourceId = token.resourceId;
          out.permissions = token.permissions;
          out.authorId = token.authorId;
          out.expiresAt = token.expiresAt;
          out.format = FormatTag::V1;
        } else if constexpr (std::is_same_v<T, BinaryTokenV2>) {
          out.resourceId = hexEncode(token.resourceId);
          out.permissions = bitmapToPermissions(token.permissions);
          out.authorId = hexEncode(token.authorId);
          out.expiresAt = token.expiresAt;
          out.format = FormatTag::V2;
        } else if constexpr (std::is_same_v<T, CompactTokenV3>) {
          out.resourceId = hexEncode(token.resourceId);
          out.permissions = bitmapToPermissions(token.permissions);
          out.authorId = hexEncode(token.authorId);
          out.expiresAt = hoursToUnix(token.expiryHours);
          out.format = FormatTag::V3;
        } else {
          out.resourceId = hexEncode(token.resourceId);
          out.permissions = bitmapToPermissions(token.permissions);
          out.authorId = token.authorName;
          out.expiresAt = hoursToUnix(token.expiryHours);
          out.format = FormatTag::V4;
        }
      },
      decoded);
  return out;
}

}  // namespace detail

std::optional<VerifiedResourceToken> verifyResourceToken(
    std::string_view token, std::string_view secret, ResourceKind kind) {
  return verifyResourceToken(token, secret, kind, unixNow());
}

std::optional<VerifiedResourceToken> verifyResourceToken(
    std::string_view token, std::string_view secret, ResourceKind kind,
    int64_t now) {
  auto decoded = detail::decodeResourceToken(token, secret, kind, now);
  if (!decoded) {
    TESSERA_LOG_DEBUG("Rejected {} token: {}", resourceKindToString(kind),
                      tokenRejectionToString(decoded.error()));
    return std::nullopt;
  }
  return detail::normalize(decoded.value(), kind);
}

std::optional<ParsedResourceToken> parseResourceToken(std::string_view token,
                                                      ResourceKind kind) {
  try {
    if (isLegacyJson(token)) {
      auto raw = base64UrlDecode(token);
      auto document = nlohmann::json::parse(raw.begin(), raw.end(), nullptr,
                                            false);
      if (document.is_discarded() || !document.is_object() ||
          !document.contains("l") || !document["l"].is_string()) {
        return std::nullopt;
      }
      return ParsedResourceToken{document["l"].get<std::string>(), kind,
                                 FormatTag::V1};
    }

    auto bytes = base64UrlDecode(token);
    auto format = detectBinaryFormat(bytes, kind);
    if (!format) return std::nullopt;
    if (*format == FormatTag::V4 && !isWellFormedV4(bytes)) {
      return std::nullopt;
    }

    const size_t idWidth = *format == FormatTag::V2 ? 8 : 6;
    return ParsedResourceToken{
        hexEncode(std::span<const uint8_t>(bytes).subspan(1, idWidth)), kind,
        *format};
  } catch (const InvalidBase64Error&) {
    return std::nullopt;
  }
}

}  // namespace tessera
