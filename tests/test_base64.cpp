#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "tessera/base64.hpp"
#include <array>

using namespace tessera;

TEST_CASE("Base64UrlEncode - Empty input") {
    std::vector<uint8_t> empty;
    CHECK(base64UrlEncode(empty).empty());
}

TEST_CASE("Base64UrlEncode - No padding") {
    std::vector<uint8_t> one = {0x4d};
    CHECK(base64UrlEncode(one) == "TQ");

    std::vector<uint8_t> four = {0x4d, 0x61, 0x6e, 0x79};
    CHECK(base64UrlEncode(four) == "TWFueQ");
}

TEST_CASE("Base64UrlEncode - URL-safe alphabet") {
    std::vector<uint8_t> data = {0x00, 0x01, 0x02, 0x03, 0xff, 0xfe, 0xfd};
    CHECK(base64UrlEncode(data) == "AAECA__-_Q");

    std::vector<uint8_t> data2 = {0xfb, 0xff};
    CHECK(base64UrlEncode(data2) == "-_8");
}

TEST_CASE("Base64UrlEncode - Text and std::array inputs") {
    CHECK(base64UrlEncode(std::string_view("{\"")) == "eyI");

    std::array<uint8_t, 3> arr = {0x4d, 0x61, 0x6e};
    CHECK(base64UrlEncode(arr) == "TWFu");
}

TEST_CASE("Base64UrlDecode - Valid input") {
    CHECK(base64UrlDecode("").empty());
    CHECK(base64UrlDecode("TQ") == std::vector<uint8_t>{0x4d});
    CHECK(base64UrlDecode("-_8") == std::vector<uint8_t>{0xfb, 0xff});
}

TEST_CASE("Base64UrlDecode - Padding is tolerated") {
    CHECK(base64UrlDecode("TWE=") == std::vector<uint8_t>{0x4d, 0x61});
    CHECK(base64UrlDecode("TQ==") == std::vector<uint8_t>{0x4d});
}

TEST_CASE("Base64UrlDecode - Invalid characters") {
    CHECK_THROWS_AS(base64UrlDecode("TW@u"), InvalidBase64Error);
    CHECK_THROWS_AS(base64UrlDecode("TW+u"), InvalidBase64Error);
    CHECK_THROWS_AS(base64UrlDecode("TW/u"), InvalidBase64Error);
    CHECK_THROWS_AS(base64UrlDecode("TW u"), InvalidBase64Error);
    CHECK_THROWS_AS(base64UrlDecode("TW\nu"), InvalidBase64Error);
}

TEST_CASE("Base64UrlDecode - Truncated input") {
    CHECK_THROWS_AS(base64UrlDecode("T"), InvalidBase64Error);
    CHECK_THROWS_AS(base64UrlDecode("TWFuT"), InvalidBase64Error);
}

TEST_CASE("Base64Encode - Standard alphabet with padding") {
    CHECK(base64Encode(std::string_view("https://gw.example.com")) ==
          "aHR0cHM6Ly9ndy5leGFtcGxlLmNvbQ==");

    std::vector<uint8_t> data2 = {0xfb, 0xff};
    CHECK(base64Encode(data2) == "+/8=");
}

TEST_CASE("Base64Decode - Standard alphabet") {
    auto decoded = base64Decode("aHR0cHM6Ly9ndy5leGFtcGxlLmNvbQ==");
    CHECK(std::string(decoded.begin(), decoded.end()) == "https://gw.example.com");
    CHECK(base64Decode("+/8=") == std::vector<uint8_t>{0xfb, 0xff});
    CHECK_THROWS_AS(base64Decode("-_8="), InvalidBase64Error);
}

TEST_CASE("Base64UrlEncode/Decode - Binary round trip") {
    std::vector<uint8_t> original;
    for (int i = 0; i < 256; ++i) {
        original.push_back(static_cast<uint8_t>(i));
    }
    CHECK(base64UrlDecode(base64UrlEncode(original)) == original);
}
