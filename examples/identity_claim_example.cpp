/**
 * @file identity_claim_example.cpp
 * @brief Inviting a pending identity and redeeming the claim link
 */

#include "tessera/config.hpp"
#include "tessera/grants.hpp"
#include "tessera/json_serialization.hpp"
#include "tessera/stateful_token.hpp"

#include <iostream>

using namespace tessera;

int main(int argc, char** argv) {
    try {
        AuthConfig config = argc > 1 ? AuthConfig::loadFromFile(argv[1])
                                     : AuthConfig().withStatefulTokenTtl(24 * 3600);
        config.applyLogging();

        InMemoryKeyValueStore kv;
        StatefulTokenStore store(kv, config);

        // Administrator side
        CreateIdentityParams params;
        params.type = IdentityType::User;
        params.displayName = "New Teammate";
        params.createdBy = "ident_admin";
        auto pending = createClaimableIdentity(params);
        kv.put(identityKvKey(pending.id), serializeIdentity(pending));

        auto token = store.issueIdentityClaimToken({pending.id, "ident_admin", "onboarding"});
        auto link = buildCompactTokenShareUrl(token.id, "https://gw.example.com",
                                              "https://console.example.com/claim");
        std::cout << "Share this link: " << link << "\n";
        std::cout << "Expires: " << toIsoString(token.expiresAt) << "\n\n";

        // Recipient side
        auto target = parseCompactTokenShareUrl(link);
        if (!target) {
            std::cerr << "Link could not be parsed\n";
            return 1;
        }
        auto claimed = store.claimIdentity(target->tokenId);
        if (!claimed.success) {
            std::cerr << "Claim failed: " << claimed.error.value_or("unknown") << "\n";
            return 1;
        }
        std::cout << "Identity " << claimed.identity->id << " is now "
                  << identityStatusToString(claimed.identity->status) << "\n";
        std::cout << "API key (shown once): " << *claimed.secret << "\n";

        auto again = store.claimIdentity(target->tokenId);
        std::cout << "Second attempt: " << again.error.value_or("accepted?") << "\n\n";

        // What the new key may do
        CreateGrantParams grant{pending.id, "kv:read", "ident_admin"};
        grant.scope = GrantScope{};
        grant.scope->namespaces = std::vector<std::string>{"team_docs"};
        auto effective = resolveEffectivePermissions({createGrant(grant)},
                                                     claimed.credential->scope);
        std::cout << "kv:read on team_docs: "
                  << (effective.canAccessNamespace("team_docs", "kv:read") ? "yes" : "no")
                  << "\n";
        std::cout << "kv:read on payroll: "
                  << (effective.canAccessNamespace("payroll", "kv:read") ? "yes" : "no")
                  << "\n";
    } catch (const TesseraError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
