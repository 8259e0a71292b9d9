#include <doctest/doctest.h>
#include "tessera/json_serialization.hpp"

using namespace tessera;
using namespace std::chrono_literals;

TEST_CASE("JSON Serialization - Credential") {
    CreateCredentialParams params{"ident_alice"};
    params.type = CredentialType::RefreshToken;
    params.expiresAt = fromUnixSeconds(1760000000);
    CredentialScope scope;
    scope.capabilities = std::vector<std::string>{"kv:read"};
    scope.resources = std::vector<ResourceScope>{{"blob", "b1", {"read"}}};
    params.scope = scope;
    auto credential = revokeCredential(createCredential(params).credential, "lost laptop",
                                       fromUnixSeconds(1750000000));

    auto text = serializeCredential(credential);
    auto document = nlohmann::json::parse(text);
    CHECK(document["type"] == "refresh_token");
    CHECK(document["status"] == "revoked");
    CHECK(document["expiresAt"] == "2025-10-09T08:53:20.000Z");
    CHECK(document["revokedAt"] == "2025-06-15T15:06:40.000Z");
    CHECK_FALSE(document.contains("lastUsedAt"));
    CHECK_FALSE(document["scope"].contains("namespaces"));

    auto restored = deserializeCredential(text);
    REQUIRE(restored.has_value());
    CHECK(restored->id == credential.id);
    CHECK(restored->secretHash == credential.secretHash);
    CHECK(restored->type == CredentialType::RefreshToken);
    CHECK(restored->status == CredentialStatus::Revoked);
    CHECK(restored->expiresAt == credential.expiresAt);
    CHECK(restored->revokedAt == credential.revokedAt);
    CHECK(restored->revocationReason == std::optional<std::string>("lost laptop"));
    CHECK(restored->scope == credential.scope);
}

TEST_CASE("JSON Serialization - Identity") {
    CreateIdentityParams params;
    params.type = IdentityType::App;
    params.displayName = "Widget";
    params.appConfig = AppConfig{"https://widget.dev", "", {"kv:read"}, false};
    params.metadata = {{"tier", "free"}};
    auto identity = createIdentity(params);

    auto document = nlohmann::json::parse(serializeIdentity(identity));
    CHECK(document["type"] == "app");
    CHECK(document["appConfig"]["namespace"] == "widget_dev");
    CHECK_FALSE(document.contains("createdBy"));

    auto restored = deserializeIdentity(serializeIdentity(identity));
    REQUIRE(restored.has_value());
    CHECK(restored->id == identity.id);
    CHECK(restored->status == IdentityStatus::Active);
    REQUIRE(restored->appConfig.has_value());
    CHECK(restored->appConfig->origin == "https://widget.dev");
    CHECK(restored->appConfig->namespace_ == "widget_dev");
    CHECK(restored->metadata == nlohmann::json{{"tier", "free"}});
    CHECK(toIsoString(restored->createdAt) == toIsoString(identity.createdAt));
}

TEST_CASE("JSON Serialization - Grant") {
    CreateGrantParams params{"ident_alice", "blob:write", "ident_admin"};
    params.source = GrantSource::Invitation;
    params.sourceId = "tk_invite";
    params.scope = GrantScope{};
    params.scope->namespaces = std::vector<std::string>{"ns_a"};
    params.scope->resources = std::vector<ResourceRef>{{"blob", "b1"}};
    params.scope->keyPatterns = std::vector<std::string>{"uploads/*"};
    auto grant = revokeGrant(createGrant(params), "ident_admin", "expired trial");

    auto restored = deserializeGrant(serializeGrant(grant));
    REQUIRE(restored.has_value());
    CHECK(restored->grantId == grant.grantId);
    CHECK(restored->source == GrantSource::Invitation);
    CHECK(restored->sourceId == std::optional<std::string>("tk_invite"));
    REQUIRE(restored->scope.has_value());
    CHECK(restored->scope->namespaces == grant.scope->namespaces);
    CHECK(restored->scope->resources == grant.scope->resources);
    CHECK(restored->scope->keyPatterns == grant.scope->keyPatterns);
    CHECK(restored->revokedBy == std::optional<std::string>("ident_admin"));
    CHECK_FALSE(isGrantValid(*restored));
}

TEST_CASE("JSON Serialization - Rejects bad records") {
    SUBCASE("Not JSON") {
        CHECK_FALSE(deserializeCredential("{").has_value());
        CHECK_FALSE(deserializeIdentity("").has_value());
    }

    SUBCASE("Missing required field") {
        CHECK_FALSE(deserializeGrant(R"({"grantId":"grant_1"})").has_value());
    }

    SUBCASE("Unknown enum value") {
        auto document = nlohmann::json::parse(
            serializeCredential(createCredential({"ident_alice"}).credential));
        document["status"] = "frozen";
        CHECK_FALSE(deserializeCredential(document.dump()).has_value());
    }

    SUBCASE("Wrong field type") {
        auto document = nlohmann::json::parse(
            serializeCredential(createCredential({"ident_alice"}).credential));
        document["secretHash"] = 42;
        CHECK_FALSE(deserializeCredential(document.dump()).has_value());
    }

    SUBCASE("from_json throws directly") {
        Identity identity;
        CHECK_THROWS_AS(json_serialization::from_json(nlohmann::json::object(), identity),
                        InvalidJsonError);
    }
}
