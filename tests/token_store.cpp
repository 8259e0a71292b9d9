#include <doctest/doctest.h>
#include <limits>
#include "tessera/json_serialization.hpp"
#include "tessera/stateful_token.hpp"

using namespace tessera;

namespace {

Identity storePendingIdentity(KeyValueStore& kv) {
    CreateIdentityParams params;
    params.type = IdentityType::User;
    params.displayName = "Invited User";
    params.createdBy = "ident_admin";
    auto identity = createClaimableIdentity(params);
    kv.put(identityKvKey(identity.id), serializeIdentity(identity));
    return identity;
}

}  // namespace

TEST_CASE("StatefulTokenStore - Issue and look up") {
    InMemoryKeyValueStore kv;
    StatefulTokenStore store(kv);

    BlobAccessTokenParams params;
    params.namespace_ = "origin_abc";
    params.blobKey = "a.txt";
    params.permissions = {"read"};
    params.createdBy = "ident_owner";
    auto issued = store.issueBlobAccessToken(params);
    CHECK(kv.size() == 1);
    CHECK(kv.get(getTokenKvKey(issued.id)).has_value());

    auto found = store.lookup(issued.id);
    CHECK(found.valid);
    REQUIRE(found.token.has_value());
    CHECK(found.token->id == issued.id);
    CHECK_FALSE(found.error.has_value());

    auto loaded = store.load(issued.id);
    REQUIRE(loaded.has_value());
    CHECK(loaded->action() == TokenAction::BlobAccess);
}

TEST_CASE("StatefulTokenStore - Lookup failures") {
    InMemoryKeyValueStore kv;
    StatefulTokenStore store(kv);

    SUBCASE("Bad format") {
        CHECK(store.lookup("nope").error == std::optional<std::string>("Invalid token format"));
    }

    SUBCASE("Unknown token") {
        auto result = store.lookup(generateTokenId());
        CHECK_FALSE(result.valid);
        CHECK(result.error == std::optional<std::string>("Token not found"));
    }

    SUBCASE("Corrupt record") {
        auto id = generateTokenId();
        kv.put(getTokenKvKey(id), "{broken");
        CHECK(store.lookup(id).error == std::optional<std::string>("Invalid token data"));
        CHECK_FALSE(store.load(id).has_value());
    }

    SUBCASE("Expired token is returned with its reason") {
        ChannelAccessTokenParams params;
        params.channelId = "chan_1";
        params.createdBy = "ident_owner";
        params.expiresInSeconds = -10;
        auto issued = store.issueChannelAccessToken(params);

        auto result = store.lookup(issued.id);
        CHECK_FALSE(result.valid);
        CHECK(result.token.has_value());
        CHECK(result.error == std::optional<std::string>("Token has expired"));
    }
}

TEST_CASE("StatefulTokenStore - Configured lifetime") {
    InMemoryKeyValueStore kv;
    StatefulTokenStore store(kv, AuthConfig().withStatefulTokenTtl(600));
    CHECK(store.config().statefulTokenTtl() == 600);

    auto token = store.issueIdentityClaimToken({"ident_x", "ident_admin"});
    CHECK(token.expiresAt - token.createdAt == std::chrono::seconds(600));

    IdentityClaimTokenParams explicitTtl{"ident_x", "ident_admin"};
    explicitTtl.expiresInSeconds = 60;
    auto shortLived = store.issueIdentityClaimToken(explicitTtl);
    CHECK(shortLived.expiresAt - shortLived.createdAt == std::chrono::seconds(60));

    CHECK_THROWS_AS(StatefulTokenStore(kv, AuthConfig().withStatefulTokenTtl(0)),
                    InvalidArgumentError);

    StatefulTokenStore forever(kv, AuthConfig().withStatefulTokenTtl(
                                       std::numeric_limits<int64_t>::max()));
    CHECK_THROWS_AS(forever.issueIdentityClaimToken({"ident_x", "ident_admin"}),
                    ExpiryOutOfRangeError);
    CHECK(kv.size() == 2);
}

TEST_CASE("StatefulTokenStore - Revoke") {
    InMemoryKeyValueStore kv;
    StatefulTokenStore store(kv);
    auto token = store.issueIdentityClaimToken({"ident_x", "ident_admin"});

    auto first = store.revoke(token.id, "Sent to the wrong person");
    CHECK(first.valid);
    REQUIRE(first.token.has_value());
    CHECK(first.token->revoked);

    auto second = store.revoke(token.id);
    CHECK_FALSE(second.valid);
    CHECK(second.error == std::optional<std::string>("Token is already revoked"));

    auto lookup = store.lookup(token.id);
    CHECK_FALSE(lookup.valid);
    CHECK(lookup.error == std::optional<std::string>("Sent to the wrong person"));

    CHECK(store.revoke("bad").error == std::optional<std::string>("Invalid token format"));
    CHECK(store.revoke(generateTokenId()).error ==
          std::optional<std::string>("Token not found"));
}

TEST_CASE("StatefulTokenStore - Claim identity") {
    InMemoryKeyValueStore kv;
    StatefulTokenStore store(kv, AuthConfig().withCredentialSecretBytes(16));
    auto pending = storePendingIdentity(kv);
    auto token = store.issueIdentityClaimToken({pending.id, "ident_admin"});

    auto claimed = store.claimIdentity(token.id);
    REQUIRE(claimed.success);
    CHECK_FALSE(claimed.error.has_value());
    REQUIRE(claimed.identity.has_value());
    REQUIRE(claimed.credential.has_value());
    REQUIRE(claimed.secret.has_value());

    CHECK(claimed.identity->id == pending.id);
    CHECK(claimed.identity->status == IdentityStatus::Active);
    CHECK(claimed.secret->size() == 32);
    CHECK(claimed.credential->identityId == pending.id);
    CHECK(verifyCredential(*claimed.credential, *claimed.secret).valid);

    SUBCASE("Records are persisted") {
        auto storedIdentity = deserializeIdentity(*kv.get(identityKvKey(pending.id)));
        REQUIRE(storedIdentity.has_value());
        CHECK(storedIdentity->status == IdentityStatus::Active);

        auto byHash = kv.get(credentialKvKey(hashApiKey(*claimed.secret)));
        REQUIRE(byHash.has_value());
        CHECK(deserializeCredential(*byHash)->id == claimed.credential->id);
        CHECK(kv.get(credentialIdKvKey(claimed.credential->id)) == byHash);

        auto storedToken = store.load(token.id);
        REQUIRE(storedToken.has_value());
        CHECK(storedToken->usedBy == std::optional<std::string>(pending.id));
    }

    SUBCASE("Single use") {
        auto again = store.claimIdentity(token.id);
        CHECK_FALSE(again.success);
        CHECK(again.error == std::optional<std::string>("Token has already been used"));
    }

    SUBCASE("A second token cannot re-claim") {
        auto another = store.issueIdentityClaimToken({pending.id, "ident_admin"});
        auto again = store.claimIdentity(another.id);
        CHECK_FALSE(again.success);
        CHECK(again.error == std::optional<std::string>("Identity has already been claimed"));
    }
}

TEST_CASE("StatefulTokenStore - Claim failures") {
    InMemoryKeyValueStore kv;
    StatefulTokenStore store(kv);

    SUBCASE("Wrong action") {
        ChannelAccessTokenParams params;
        params.channelId = "chan_1";
        params.createdBy = "ident_owner";
        auto token = store.issueChannelAccessToken(params);
        CHECK(store.claimIdentity(token.id).error ==
              std::optional<std::string>("This token cannot be used for identity claim"));
    }

    SUBCASE("Missing identity") {
        auto token = store.issueIdentityClaimToken({"ident_ghost", "ident_admin"});
        CHECK(store.claimIdentity(token.id).error ==
              std::optional<std::string>("Identity not found"));
    }

    SUBCASE("Corrupt identity") {
        kv.put(identityKvKey("ident_bad"), "[]");
        auto token = store.issueIdentityClaimToken({"ident_bad", "ident_admin"});
        CHECK(store.claimIdentity(token.id).error ==
              std::optional<std::string>("Invalid identity data"));
    }

    SUBCASE("Revoked token") {
        auto pending = storePendingIdentity(kv);
        auto token = store.issueIdentityClaimToken({pending.id, "ident_admin"});
        store.revoke(token.id);
        auto result = store.claimIdentity(token.id);
        CHECK_FALSE(result.success);
        CHECK(result.error == std::optional<std::string>("Token has been revoked"));
    }
}
