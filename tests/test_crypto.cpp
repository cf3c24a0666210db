#include <catch2/catch_test_macros.hpp>
#include "tether/crypto.hpp"
#include <string>

using namespace tether::crypto;

TEST_CASE("SHA-256 known answer", "[crypto]")
{
    REQUIRE(SHA256::to_hex(SHA256::hash(std::string_view("abc"))) ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    std::string text = "abc";
    Bytes bytes(text.begin(), text.end());
    REQUIRE(SHA256::hash(bytes) == SHA256::hash(std::string_view(text)));
}

TEST_CASE("HMAC-SHA-256 matches RFC 4231", "[crypto]")
{
    // test case 2
    REQUIRE(HmacSha256::compute_hex("Jefe", "what do ya want for nothing?") ==
            "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST_CASE("HMAC keys change the digest", "[crypto]")
{
    auto a = HmacSha256::compute("salt-a", "patient-17");
    auto b = HmacSha256::compute("salt-b", "patient-17");
    REQUIRE(a != b);
    REQUIRE(a == HmacSha256::compute("salt-a", "patient-17"));

    // keys longer than the block size are accepted
    std::string long_key(200, 'k');
    REQUIRE(HmacSha256::compute_hex(long_key, "x").size() == 64);
}
