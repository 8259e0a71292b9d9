#include <benchmark/benchmark.h>
#include "tessera/byte_codec.hpp"
#include "tessera/crypto.hpp"
#include <string>
#include <vector>

using namespace tessera;

static const std::vector<uint8_t> V3_PAYLOAD(13, 0x42);
static const std::vector<uint8_t> LARGE_DATA(1024, 0x42);

static void BM_HMAC_Sign_TokenPayload(benchmark::State& state) {
    HmacSigner signer(randomHex(32));
    for (auto _ : state) {
        auto signature = signer.sign(V3_PAYLOAD);
        benchmark::DoNotOptimize(signature);
    }
}
BENCHMARK(BM_HMAC_Sign_TokenPayload);

static void BM_HMAC_Sign_Large(benchmark::State& state) {
    HmacSigner signer(randomHex(32));
    for (auto _ : state) {
        auto signature = signer.sign(LARGE_DATA);
        benchmark::DoNotOptimize(signature);
    }
}
BENCHMARK(BM_HMAC_Sign_Large);

static void BM_HMAC_VerifyTruncated(benchmark::State& state) {
    HmacSigner signer(randomHex(32));
    auto signature = signer.signTruncated(V3_PAYLOAD, 12);
    for (auto _ : state) {
        bool valid = signer.verifyTruncated(V3_PAYLOAD, signature);
        benchmark::DoNotOptimize(valid);
    }
}
BENCHMARK(BM_HMAC_VerifyTruncated);

static void BM_SHA256_ApiKey(benchmark::State& state) {
    const std::string apiKey = randomHex(32);
    for (auto _ : state) {
        auto hash = sha256Hex(apiKey);
        benchmark::DoNotOptimize(hash);
    }
}
BENCHMARK(BM_SHA256_ApiKey);

static void BM_RandomHex(benchmark::State& state) {
    const size_t bytes = static_cast<size_t>(state.range(0));
    for (auto _ : state) {
        auto value = randomHex(bytes);
        benchmark::DoNotOptimize(value);
    }
}
BENCHMARK(BM_RandomHex)->Arg(2)->Arg(16)->Arg(32);
