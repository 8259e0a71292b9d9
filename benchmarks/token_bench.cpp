#include <benchmark/benchmark.h>
#include "tessera/crypto.hpp"
#include "tessera/grants.hpp"
#include "tessera/resource_token.hpp"
#include "tessera/unified_token.hpp"

using namespace tessera;

static constexpr int64_t NOW = 1750000000;

static CreateResourceTokenParams CreateChannelParams(bool named) {
    CreateResourceTokenParams params;
    params.kind = ResourceKind::Channel;
    params.resourceId = "abc123abc123";
    params.permissions = {"read", "append"};
    params.expiresInSeconds = 3600;
    if (named) {
        params.displayName = "alice";
    } else {
        params.authorId = "beef";
    }
    return params;
}

static void BM_ResourceToken_Create_V3(benchmark::State& state) {
    auto params = CreateChannelParams(false);
    for (auto _ : state) {
        auto issued = createResourceToken(params, "secret", NOW);
        benchmark::DoNotOptimize(issued);
    }
}
BENCHMARK(BM_ResourceToken_Create_V3);

static void BM_ResourceToken_Verify_V3(benchmark::State& state) {
    auto token = createResourceToken(CreateChannelParams(false), "secret", NOW).token;
    for (auto _ : state) {
        auto verified = verifyResourceToken(token, "secret", ResourceKind::Channel, NOW);
        benchmark::DoNotOptimize(verified);
    }
}
BENCHMARK(BM_ResourceToken_Verify_V3);

static void BM_ResourceToken_Verify_V4(benchmark::State& state) {
    auto token = createResourceToken(CreateChannelParams(true), "secret", NOW).token;
    for (auto _ : state) {
        auto verified = verifyResourceToken(token, "secret", ResourceKind::Channel, NOW);
        benchmark::DoNotOptimize(verified);
    }
}
BENCHMARK(BM_ResourceToken_Verify_V4);

static void BM_ResourceToken_Reject_BadSignature(benchmark::State& state) {
    auto token = createResourceToken(CreateChannelParams(true), "secret", NOW).token;
    for (auto _ : state) {
        auto verified = verifyResourceToken(token, "other", ResourceKind::Channel, NOW);
        benchmark::DoNotOptimize(verified);
    }
}
BENCHMARK(BM_ResourceToken_Reject_BadSignature);

static void BM_UnifiedToken_Verify_Share(benchmark::State& state) {
    CreateUnifiedTokenParams params;
    params.type = UnifiedTokenType::Share;
    params.permissions = unified_permission::READ;
    params.expiresInSeconds = 3600;
    params.claims = ResourceClaims{"blob", "photos/cat.png", "ident_owner", {}};
    auto token = createUnifiedToken(params, "secret", NOW).token;

    for (auto _ : state) {
        auto verified = verifyUnifiedToken(token, "secret", NOW);
        benchmark::DoNotOptimize(verified);
    }
}
BENCHMARK(BM_UnifiedToken_Verify_Share);

static void BM_ResolveEffectivePermissions(benchmark::State& state) {
    const auto count = static_cast<size_t>(state.range(0));
    std::vector<CapabilityGrant> grants;
    for (size_t i = 0; i < count; ++i) {
        CreateGrantParams params{"ident_bench", "cap:" + std::to_string(i % 8), "ident_admin"};
        params.scope = GrantScope{};
        params.scope->namespaces = std::vector<std::string>{"ns_" + std::to_string(i)};
        params.scope->keyPatterns = std::vector<std::string>{"k" + std::to_string(i) + "/*"};
        grants.push_back(createGrant(params));
    }
    const auto now = Clock::now();

    for (auto _ : state) {
        auto effective = resolveEffectivePermissions(grants, std::nullopt, std::nullopt, now);
        benchmark::DoNotOptimize(effective);
    }
    state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_ResolveEffectivePermissions)->Range(8, 512)->Complexity();
