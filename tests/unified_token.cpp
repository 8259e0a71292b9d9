#include <doctest/doctest.h>
#include <limits>
#include "tessera/base64.hpp"
#include "tessera/byte_codec.hpp"
#include "tessera/crypto.hpp"
#include "tessera/unified_token.hpp"

using namespace tessera;

namespace {

constexpr int64_t NOW = 1750000000;

CreateUnifiedTokenParams shareParams() {
    CreateUnifiedTokenParams params;
    params.type = UnifiedTokenType::Share;
    params.permissions = unified_permission::READ | unified_permission::SHARE;
    params.expiresInSeconds = 86400;
    ResourceClaims claims;
    claims.resourceType = "blob";
    claims.resourceId = "photos/cat.png";
    claims.authorId = "ident_01";
    claims.constraints.maxUses = 5;
    claims.constraints.canDelegate = true;
    claims.constraints.maxDelegationDepth = 2;
    params.claims = claims;
    return params;
}

std::string signRaw(std::vector<uint8_t> payload, std::string_view secret) {
    auto signature = HmacSigner(secret).signTruncated(payload, 12);
    payload.insert(payload.end(), signature.begin(), signature.end());
    return base64UrlEncode(payload);
}

}  // namespace

TEST_CASE("UnifiedToken - Bearer") {
    CreateUnifiedTokenParams params;
    params.type = UnifiedTokenType::Bearer;
    params.permissions = unified_permission::READ | unified_permission::WRITE;
    params.expiresInSeconds = 900;
    params.claims = BearerClaims{"ident_abc"};

    auto issued = createUnifiedToken(params, "k", NOW);
    CHECK(issued.expiresAt == NOW + 900);

    auto token = verifyUnifiedToken(issued.token, "k", NOW);
    REQUIRE(token.has_value());
    CHECK(token->version == UNIFIED_TOKEN_VERSION);
    CHECK(token->type == UnifiedTokenType::Bearer);
    CHECK(token->permissions == 0x03);
    CHECK(token->issuedAt == NOW);
    CHECK(token->expiresAt == NOW + 900);
    REQUIRE(std::holds_alternative<BearerClaims>(token->claims));
    CHECK(std::get<BearerClaims>(token->claims).identityId == "ident_abc");

    CHECK_FALSE(verifyUnifiedToken(issued.token, "other", NOW));
}

TEST_CASE("UnifiedToken - Share with constraints") {
    auto issued = createUnifiedToken(shareParams(), "k", NOW);
    auto token = verifyUnifiedToken(issued.token, "k", NOW);
    REQUIRE(token.has_value());
    CHECK(token->type == UnifiedTokenType::Share);

    REQUIRE(std::holds_alternative<ResourceClaims>(token->claims));
    const auto& claims = std::get<ResourceClaims>(token->claims);
    CHECK(claims.resourceType == "blob");
    CHECK(claims.resourceId == "photos/cat.png");
    CHECK(claims.authorId == "ident_01");
    CHECK(claims.constraints.maxUses == uint16_t{5});
    CHECK(claims.constraints.canDelegate);
    CHECK(claims.constraints.maxDelegationDepth == uint8_t{2});
    CHECK(claims.constraints.requiresStateCheck);
}

TEST_CASE("UnifiedToken - Resource without constraints") {
    CreateUnifiedTokenParams params;
    params.type = UnifiedTokenType::Resource;
    params.permissions = unified_permission::ADMIN;
    params.expiresInSeconds = 60;
    params.claims = ResourceClaims{"kv", "settings", "ident_02", {}};

    auto token = verifyUnifiedToken(createUnifiedToken(params, "k", NOW).token, "k", NOW);
    REQUIRE(token.has_value());
    const auto& claims = std::get<ResourceClaims>(token->claims);
    CHECK(claims.resourceType == "kv");
    CHECK(claims.constraints == TokenConstraints{});
    CHECK_FALSE(claims.constraints.requiresStateCheck);
}

TEST_CASE("UnifiedToken - Invitation carries capabilities") {
    CreateUnifiedTokenParams params;
    params.type = UnifiedTokenType::Invitation;
    params.expiresInSeconds = 3600;
    params.claims = InvitationClaims{"ident_new", {"kv:read", "blob:write"}};

    auto token = verifyUnifiedToken(createUnifiedToken(params, "k", NOW).token, "k", NOW);
    REQUIRE(token.has_value());
    const auto& claims = std::get<InvitationClaims>(token->claims);
    CHECK(claims.identityId == "ident_new");
    CHECK(claims.grantedCapabilities == std::vector<std::string>{"kv:read", "blob:write"});
}

TEST_CASE("UnifiedToken - Expiry") {
    auto issued = createUnifiedToken(shareParams(), "k", NOW);
    CHECK(verifyUnifiedToken(issued.token, "k", issued.expiresAt).has_value());

    auto decoded = detail::decodeUnifiedToken(issued.token, "k", issued.expiresAt + 1);
    REQUIRE(decoded.isError());
    CHECK(decoded.error() == TokenRejection::Expired);
}

TEST_CASE("UnifiedToken - Tampered signature bytes are rejected") {
    CreateUnifiedTokenParams bearer;
    bearer.type = UnifiedTokenType::Bearer;
    bearer.claims = BearerClaims{"ident_abc"};

    CreateUnifiedTokenParams resource;
    resource.type = UnifiedTokenType::Resource;
    resource.claims = ResourceClaims{"kv", "settings", "ident_02", {}};

    CreateUnifiedTokenParams invitation;
    invitation.type = UnifiedTokenType::Invitation;
    invitation.claims = InvitationClaims{"ident_new", {"kv:read"}};

    for (const auto& params : {bearer, resource, shareParams(), invitation}) {
        CAPTURE(static_cast<int>(params.type));
        auto issued = createUnifiedToken(params, "k", NOW);
        REQUIRE(verifyUnifiedToken(issued.token, "k", NOW).has_value());

        auto bytes = base64UrlDecode(issued.token);
        for (size_t i = bytes.size() - 12; i < bytes.size(); ++i) {
            CAPTURE(i);
            auto tampered = bytes;
            tampered[i] ^= 0x01;
            auto decoded = detail::decodeUnifiedToken(base64UrlEncode(tampered), "k", NOW);
            REQUIRE(decoded.isError());
            CHECK(decoded.error() == TokenRejection::BadSignature);
        }
    }
}

TEST_CASE("UnifiedToken - Rejection reasons") {
    SUBCASE("Too short") {
        auto decoded = detail::decodeUnifiedToken("AQE", "k", NOW);
        REQUIRE(decoded.isError());
        CHECK(decoded.error() == TokenRejection::Malformed);
    }

    SUBCASE("Not base64") {
        auto decoded = detail::decodeUnifiedToken("$$$$", "k", NOW);
        REQUIRE(decoded.isError());
        CHECK(decoded.error() == TokenRejection::Malformed);
    }

    SUBCASE("Unknown type with a valid signature") {
        std::vector<uint8_t> payload(12, 0);
        payload[0] = UNIFIED_TOKEN_VERSION;
        payload[1] = 0x09;
        auto decoded = detail::decodeUnifiedToken(signRaw(payload, "k"), "k", NOW);
        REQUIRE(decoded.isError());
        CHECK(decoded.error() == TokenRejection::UnknownVersion);
    }

    SUBCASE("Unknown version with a valid signature") {
        std::vector<uint8_t> payload(12, 0);
        payload[0] = 0x02;
        payload[1] = static_cast<uint8_t>(UnifiedTokenType::Bearer);
        auto decoded = detail::decodeUnifiedToken(signRaw(payload, "k"), "k", NOW);
        REQUIRE(decoded.isError());
        CHECK(decoded.error() == TokenRejection::UnknownVersion);
    }

    SUBCASE("Signed but truncated fields") {
        // Bearer whose identity length prefix points past the payload
        ByteWriter writer;
        writer.putU8(UNIFIED_TOKEN_VERSION).putU8(0x01).putU16(0)
            .putU32(0).putU32(0xFFFFFFFFULL).putU8(40);
        auto decoded = detail::decodeUnifiedToken(signRaw(writer.bytes(), "k"), "k", NOW);
        REQUIRE(decoded.isError());
        CHECK(decoded.error() == TokenRejection::Malformed);
    }
}

TEST_CASE("UnifiedToken - Caller errors throw") {
    SUBCASE("Claims do not match type") {
        CreateUnifiedTokenParams params;
        params.type = UnifiedTokenType::Share;
        params.claims = BearerClaims{"ident"};
        CHECK_THROWS_AS(createUnifiedToken(params, "k", NOW), InvalidArgumentError);
    }

    SUBCASE("Identity longer than its length prefix") {
        CreateUnifiedTokenParams params;
        params.claims = BearerClaims{std::string(300, 'x')};
        CHECK_THROWS_AS(createUnifiedToken(params, "k", NOW), InvalidArgumentError);
    }

    SUBCASE("Duration overflows") {
        CreateUnifiedTokenParams params;
        params.claims = BearerClaims{"ident"};
        params.expiresInSeconds = std::numeric_limits<int64_t>::max();
        CHECK_THROWS_AS(createUnifiedToken(params, "k", NOW), ExpiryOutOfRangeError);

        params.expiresInSeconds = std::numeric_limits<int64_t>::min();
        CHECK_THROWS_AS(createUnifiedToken(params, "k", NOW), ExpiryOutOfRangeError);
    }

    SUBCASE("Issued before the token epoch") {
        CreateUnifiedTokenParams params;
        params.claims = BearerClaims{"ident"};
        CHECK_THROWS_AS(createUnifiedToken(params, "k", 1000), ExpiryOutOfRangeError);
    }
}

TEST_CASE("UnifiedToken - Parse without secret") {
    auto issued = createUnifiedToken(shareParams(), "k", NOW);
    auto parsed = parseUnifiedToken(issued.token);
    REQUIRE(parsed.has_value());
    CHECK(parsed->type == UnifiedTokenType::Share);
    CHECK(parsed->resourceType == std::optional<std::string>("blob"));
    CHECK(parsed->resourceId == std::optional<std::string>("photos/cat.png"));

    CreateUnifiedTokenParams bearer;
    bearer.claims = BearerClaims{"ident"};
    auto parsedBearer = parseUnifiedToken(createUnifiedToken(bearer, "k", NOW).token);
    REQUIRE(parsedBearer.has_value());
    CHECK(parsedBearer->type == UnifiedTokenType::Bearer);
    CHECK_FALSE(parsedBearer->resourceId.has_value());

    CHECK_FALSE(parseUnifiedToken("AQ"));
    CHECK_FALSE(parseUnifiedToken("@@@@"));
}

TEST_CASE("UnifiedToken - Resource type codes") {
    CHECK(encodeResourceType("kv") == 0x01);
    CHECK(encodeResourceType("namespace") == 0x04);
    CHECK(encodeResourceType("queue") == 0x00);
    CHECK(decodeResourceType(0x03) == "channel");
    CHECK(decodeResourceType(0x7F) == "unknown");
}
