#include <doctest/doctest.h>
#include "tessera/crypto.hpp"
#include "tessera/grants.hpp"
#include "tessera/json_serialization.hpp"
#include "tessera/namespace_alias.hpp"
#include "tessera/resource_token.hpp"
#include "tessera/signed_url.hpp"
#include "tessera/stateful_token.hpp"
#include "tessera/unified_token.hpp"

using namespace tessera;

auto createAppIdentity(KeyValueStore& kv) {
    CreateIdentityParams params;
    params.type = IdentityType::App;
    params.displayName = "Photo Board";
    params.createdBy = "ident_admin";
    params.appConfig = AppConfig{"https://photos.example.com", "", {"blob:read"}, false};
    auto identity = createClaimableIdentity(params);
    kv.put(identityKvKey(identity.id), serializeIdentity(identity));
    return identity;
}

TEST_CASE("InvitationToFirstRequest") {
    InMemoryKeyValueStore kv;
    StatefulTokenStore store(kv);

    // Admin invites a pending app and shares the link
    auto pending = createAppIdentity(kv);
    auto invite = store.issueIdentityClaimToken({pending.id, "ident_admin"});
    auto link = buildCompactTokenShareUrl(invite.id, "https://gw.example.com",
                                          "https://console.example.com/claim");

    // The recipient follows the link
    auto target = parseCompactTokenShareUrl(link);
    REQUIRE(target.has_value());
    CHECK(target->gatewayUrl == "https://gw.example.com");

    auto claimed = store.claimIdentity(target->tokenId);
    REQUIRE(claimed.success);
    REQUIRE(claimed.identity.has_value());
    REQUIRE(claimed.secret.has_value());
    CHECK(isIdentityActive(*claimed.identity));

    // The gateway authenticates the API key by hash lookup
    auto stored = kv.get(credentialKvKey(hashApiKey(*claimed.secret)));
    REQUIRE(stored.has_value());
    auto credential = deserializeCredential(*stored);
    REQUIRE(credential.has_value());
    auto verified = verifyCredential(*credential, *claimed.secret);
    CHECK(verified.valid);
    CHECK(verified.identityId == std::optional<std::string>(pending.id));

    // Permissions come from the app's grants
    const std::string ns = claimed.identity->appConfig->namespace_;
    CHECK(ns == "photos_example_com");
    CreateGrantParams grantParams{pending.id, "blob:read", "ident_admin"};
    grantParams.scope = GrantScope{};
    grantParams.scope->namespaces = std::vector<std::string>{ns};
    auto effective = resolveEffectivePermissions({createGrant(grantParams)}, credential->scope);
    CHECK(effective.canAccessNamespace(ns, "blob:read"));
    CHECK_FALSE(effective.canAccessNamespace(ns, "blob:write"));

    // The link is spent
    CHECK_FALSE(store.claimIdentity(target->tokenId).success);
}

TEST_CASE("ChannelSharingWorkflow") {
    const std::string channelSecret = randomHex(32);

    CreateResourceTokenParams params;
    params.resourceId = randomHex(6);
    params.permissions = {"read", "append", "delete:own"};
    params.displayName = "Maria";
    params.expiresInSeconds = 24 * 3600;
    auto issued = createChannelToken(params, channelSecret);

    // Server side: find the channel, then verify with its secret
    auto parsed = parseResourceToken(issued.token, ResourceKind::Channel);
    REQUIRE(parsed.has_value());
    CHECK(parsed->resourceId == params.resourceId);

    auto verified = verifyResourceToken(issued.token, channelSecret, ResourceKind::Channel);
    REQUIRE(verified.has_value());
    CHECK(verified->authorId == "Maria");
    CHECK(verified->permissions ==
          std::vector<std::string>{"read", "append", "delete:own"});

    CHECK_FALSE(verifyResourceToken(issued.token, randomHex(32), ResourceKind::Channel));
}

TEST_CASE("BlobDownloadWorkflow") {
    InMemoryKeyValueStore kv;
    const std::string ns = "origin_" + sha256Hex("https://photos.example.com").substr(0, 40);
    REQUIRE(isFullNamespace(ns));

    auto alias = getOrCreateAlias(kv, ns);
    auto resolved = resolveNamespace(kv, alias);
    REQUIRE(resolved.has_value());
    CHECK(*resolved == ns);

    auto url = generateSignedDownloadUrl("https://gw.example.com", alias, "cat.png",
                                         "blob-secret", 300, 1750000000);
    SignedUrlParams presented{alias, "cat.png", url.expiresAt};
    auto sigStart = url.url.find("sig=") + 4;
    auto signature = url.url.substr(sigStart, url.url.find('&') - sigStart);
    CHECK(verifyDownloadUrl(presented, signature, "blob-secret"));
}

TEST_CASE("UnifiedShareWorkflow") {
    CreateUnifiedTokenParams params;
    params.type = UnifiedTokenType::Share;
    params.permissions = unified_permission::READ;
    params.expiresInSeconds = 600;
    ResourceClaims claims;
    claims.resourceType = "channel";
    claims.resourceId = "chan_general";
    claims.authorId = "ident_owner";
    claims.constraints.maxUses = 1;
    params.claims = claims;

    auto issued = createUnifiedToken(params, "gateway-secret");
    auto parsed = parseUnifiedToken(issued.token);
    REQUIRE(parsed.has_value());
    CHECK(parsed->resourceId == std::optional<std::string>("chan_general"));

    auto token = verifyUnifiedToken(issued.token, "gateway-secret");
    REQUIRE(token.has_value());
    CHECK(std::get<ResourceClaims>(token->claims).constraints.requiresStateCheck);
}

TEST_CASE("ErrorHandlingWorkflow") {
    CHECK_THROWS_AS(createCredential({""}), InvalidArgumentError);
    CHECK_THROWS_AS(activateIdentity(Identity{}), InvalidStateTransitionError);

    try {
        CreateResourceTokenParams params;
        params.resourceId = "abc";
        params.permissions = {"teleport"};
        createChannelToken(params, "k");
        FAIL("expected an exception");
    } catch (const TesseraError& e) {
        CHECK(e.errorCode() == ErrorCode::INVALID_ARGUMENT);
        CHECK(std::string(e.what()).find("teleport") != std::string::npos);
    }
}
