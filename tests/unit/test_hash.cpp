#include <catch2/catch_all.hpp>
#include "keynet/crypto/hash.hpp"
#include <string>
#include <string_view>

using namespace keynet::crypto;

namespace {

std::span<const uint8_t> as_bytes(std::string_view s) {
    return {reinterpret_cast<const uint8_t*>(s.data()), s.size()};
}

}  // namespace

TEST_CASE("SHA-1 of abc", "[crypto][hash][unit]") {
    auto digest = sha1(as_bytes("abc"));
    REQUIRE(digest.has_value());
    CHECK(to_hex(*digest) == "a9993e364706816aba3e25717850c26c9cd0d89d");
}

TEST_CASE("SHA-512 of abc", "[crypto][hash][unit]") {
    auto digest = sha512(as_bytes("abc"));
    REQUIRE(digest.has_value());
    CHECK(to_hex(*digest) ==
          "ddaf35a193617abacc417349ae20413112e6fa4e89a97ea20a9eeee64b55d39a"
          "2192992a274fc1a836ba3c23a3feebbd454d4423643ce80e2a9ac94fa54ca49f");
}

TEST_CASE("SHA3-256 known answers", "[crypto][hash][unit]") {
    auto empty = sha3_256({});
    REQUIRE(empty.has_value());
    CHECK(to_hex(*empty) == "a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a");

    auto abc = sha3_256(as_bytes("abc"));
    REQUIRE(abc.has_value());
    CHECK(to_hex(*abc) == "3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532");
}

TEST_CASE("Hasher incremental updates match one-shot digest", "[crypto][hash][unit]") {
    Hasher hasher(HashAlgorithm::Sha3_256);
    REQUIRE(hasher.update(std::string_view("a")).has_value());
    REQUIRE(hasher.update(as_bytes("bc")).has_value());

    auto digest = hasher.finalize();
    REQUIRE(digest.has_value());
    REQUIRE(digest->size() == SHA3_256_DIGEST_LEN);

    auto expected = sha3_256(as_bytes("abc"));
    REQUIRE(expected.has_value());
    CHECK(std::equal(digest->begin(), digest->end(), expected->begin()));
}

TEST_CASE("Hasher can be reused after finalize", "[crypto][hash][unit]") {
    Hasher hasher(HashAlgorithm::Sha1);
    REQUIRE(hasher.update(std::string_view("abc")).has_value());
    auto first = hasher.finalize();
    REQUIRE(first.has_value());

    REQUIRE(hasher.update(std::string_view("abc")).has_value());
    auto second = hasher.finalize();
    REQUIRE(second.has_value());

    CHECK(*first == *second);
}

TEST_CASE("Hex encoding", "[crypto][hash][unit]") {
    std::vector<uint8_t> data = {0x00, 0x0f, 0xa5, 0xff};
    CHECK(to_hex(data) == "000fa5ff");

    auto decoded = from_hex("000FA5ff");
    REQUIRE(decoded.has_value());
    CHECK(*decoded == data);

    CHECK_FALSE(from_hex("abc").has_value());
    CHECK_FALSE(from_hex("zz").has_value());
}

TEST_CASE("Base64 encoding", "[crypto][hash][unit]") {
    CHECK(to_base64(as_bytes("foobar")) == "Zm9vYmFy");
    CHECK(to_base64(as_bytes("fo")) == "Zm8=");

    auto decoded = from_base64("Zm9vYmFy");
    REQUIRE(decoded.has_value());
    CHECK(std::string(decoded->begin(), decoded->end()) == "foobar");

    auto empty = from_base64("");
    REQUIRE(empty.has_value());
    CHECK(empty->empty());
}

TEST_CASE("Base32 encoding uses the lowercase RFC 4648 alphabet", "[crypto][hash][base32][unit]") {
    CHECK(to_base32(as_bytes("")) == "");
    CHECK(to_base32(as_bytes("f")) == "my");
    CHECK(to_base32(as_bytes("fo")) == "mzxq");
    CHECK(to_base32(as_bytes("foo")) == "mzxw6");
    CHECK(to_base32(as_bytes("foob")) == "mzxw6yq");
    CHECK(to_base32(as_bytes("fooba")) == "mzxw6ytb");
    CHECK(to_base32(as_bytes("foobar")) == "mzxw6ytboi");
}

TEST_CASE("Base32 decoding", "[crypto][hash][base32][unit]") {
    SECTION("accepts either case") {
        auto lower = from_base32("mzxw6ytboi");
        auto upper = from_base32("MZXW6YTBOI");
        REQUIRE(lower.has_value());
        REQUIRE(upper.has_value());
        CHECK(std::string(lower->begin(), lower->end()) == "foobar");
        CHECK(*lower == *upper);
    }

    SECTION("rejects characters outside the alphabet") {
        CHECK(from_base32("mzxw6yt1").error() == HashError::InvalidEncoding);
        CHECK(from_base32("mzxw6yt8").error() == HashError::InvalidEncoding);
        CHECK(from_base32("my======").error() == HashError::InvalidEncoding);
    }

    SECTION("rejects non-zero trailing bits") {
        CHECK_FALSE(from_base32("mz").has_value());
        CHECK(from_base32("my").has_value());
    }

    SECTION("rejects a dangling character") {
        CHECK_FALSE(from_base32("mzxw6ytbo").has_value());
    }
}

TEST_CASE("constant_time_compare", "[crypto][hash][unit]") {
    std::array<uint8_t, 4> a = {1, 2, 3, 4};
    std::array<uint8_t, 4> b = {1, 2, 3, 4};
    std::array<uint8_t, 4> c = {1, 2, 3, 5};
    std::array<uint8_t, 3> d = {1, 2, 3};

    CHECK(constant_time_compare(a, b));
    CHECK_FALSE(constant_time_compare(a, c));
    CHECK_FALSE(constant_time_compare(a, d));
}

TEST_CASE("random_bytes returns the requested length", "[crypto][hash][unit]") {
    auto a = random_bytes(32);
    auto b = random_bytes(32);
    REQUIRE(a.size() == 32);
    REQUIRE(b.size() == 32);
    CHECK(a != b);
}
