#include <doctest/doctest.h>
#include <cstring>
#include <vector>
#include "tessera/crypto.hpp"
#include "tessera/secure_vector.hpp"

using namespace tessera;

TEST_CASE("SecureAllocator: BasicAllocation") {
    SecureAllocator<uint8_t> allocator;

    auto ptr = allocator.allocate(1024);
    REQUIRE(ptr != nullptr);

    std::memset(ptr, 0xAA, 1024);
    CHECK(ptr[0] == 0xAA);
    CHECK(ptr[1023] == 0xAA);

    allocator.deallocate(ptr, 1024);
}

TEST_CASE("SecureAllocator: ZeroAllocation") {
    SecureAllocator<uint8_t> allocator;
    CHECK(allocator.allocate(0) == nullptr);
    allocator.deallocate(nullptr, 0);
}

TEST_CASE("SecureVector: Holds signing keys") {
    std::string secret = "per-resource-secret";
    SecureVector<uint8_t> key(secret.begin(), secret.end());
    REQUIRE(key.size() == secret.size());

    HmacSigner fromText(secret);
    HmacSigner fromKey(std::move(key));
    std::vector<uint8_t> data = {1, 2, 3};
    CHECK(fromText.sign(data) == fromKey.sign(data));
}

TEST_CASE("SecureVector: MoveSemantics") {
    SecureVector<uint8_t> vec1 = {0x01, 0x02, 0x03};
    SecureVector<uint8_t> vec2 = std::move(vec1);
    CHECK(vec2.size() == 3);
    CHECK(vec2[0] == 0x01);

    SecureVector<uint8_t> vec3 = {0xAA};
    vec2.swap(vec3);
    CHECK(vec2.size() == 1);
    CHECK(vec3.size() == 3);
}

TEST_CASE("SecureUtils: ConstantTimeCompare") {
    uint8_t a[] = {1, 2, 3, 4};
    uint8_t b[] = {1, 2, 3, 4};
    uint8_t c[] = {1, 2, 3, 5};
    CHECK(secure_utils::constantTimeCompare(a, b, 4) == 0);
    CHECK(secure_utils::constantTimeCompare(a, c, 4) != 0);
    CHECK(secure_utils::constantTimeCompare(a, c, 3) == 0);
}
