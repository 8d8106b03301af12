#include <catch2/catch_all.hpp>
#include "keynet/crypto/address.hpp"
#include "keynet/crypto/hash.hpp"
#include "fixtures/key_fixtures.hpp"
#include <algorithm>
#include <cctype>

using namespace keynet::crypto;
namespace fx = keynet::test::fixtures;

namespace {

// pubkey || checksum || version, encoded without validation
std::string raw_address(std::span<const uint8_t> pk,
                        std::array<uint8_t, 2> checksum,
                        uint8_t version) {
    std::vector<uint8_t> bytes(pk.begin(), pk.end());
    bytes.push_back(checksum[0]);
    bytes.push_back(checksum[1]);
    bytes.push_back(version);
    return to_base32(bytes);
}

}  // namespace

TEST_CASE("Address golden vectors", "[crypto][address][unit]") {
    SECTION("zero-seed public key") {
        auto address = encode_address(fx::bytes_from_hex(fx::ZERO_SEED_PUBLIC));
        REQUIRE(address.has_value());
        CHECK(*address == fx::ZERO_SEED_ADDRESS);
    }

    SECTION("RFC 8032 test 1 public key") {
        auto address = encode_address(fx::bytes_from_hex(fx::RFC8032_TEST1_PUBLIC));
        REQUIRE(address.has_value());
        CHECK(*address == fx::RFC8032_TEST1_ADDRESS);
    }

    SECTION("counting-seed public key") {
        auto pk = Ed25519PublicKey::from_bytes(fx::bytes_from_hex(fx::COUNTING_SEED_PUBLIC));
        REQUIRE(pk.has_value());
        auto address = encode_address(*pk);
        REQUIRE(address.has_value());
        CHECK(*address == fx::COUNTING_SEED_ADDRESS);
    }

    SECTION("all-zero public key") {
        std::array<uint8_t, 32> zero{};
        auto address = encode_address(zero);
        REQUIRE(address.has_value());
        CHECK(*address == fx::ZERO_KEY_ADDRESS);
    }
}

TEST_CASE("Addresses are deterministic and well-formed", "[crypto][address][unit]") {
    for (int i = 0; i < 16; ++i) {
        auto pk = random_bytes(32);
        auto first = encode_address(pk);
        auto second = encode_address(pk);
        REQUIRE(first.has_value());
        REQUIRE(second.has_value());

        CHECK(*first == *second);
        CHECK(first->size() == KEYNET_ADDRESS_LEN);
        CHECK(std::all_of(first->begin(), first->end(), [](char c) {
            return (c >= 'a' && c <= 'z') || (c >= '2' && c <= '7');
        }));
        // Version 3 always ends the label in 'd'
        CHECK(first->back() == 'd');
    }
}

TEST_CASE("Address encoding rejects wrong key lengths", "[crypto][address][unit]") {
    std::array<uint8_t, 31> short_key{};
    std::array<uint8_t, 33> long_key{};
    CHECK(encode_address(short_key).error() == KeyError::InvalidKeyLength);
    CHECK(encode_address(long_key).error() == KeyError::InvalidKeyLength);
}

TEST_CASE("Address checksum uses the domain-separation prefix", "[crypto][address][unit]") {
    auto pk = fx::bytes_from_hex(fx::ZERO_SEED_PUBLIC);
    auto checksum = address_checksum(pk);
    REQUIRE(checksum.has_value());

    std::vector<uint8_t> input(KEYNET_CHECKSUM_PREFIX.begin(), KEYNET_CHECKSUM_PREFIX.end());
    input.insert(input.end(), pk.begin(), pk.end());
    input.push_back(0x03);
    auto digest = sha3_256(input);
    REQUIRE(digest.has_value());

    CHECK((*checksum)[0] == (*digest)[0]);
    CHECK((*checksum)[1] == (*digest)[1]);
}

TEST_CASE("decode_address recovers the public key", "[crypto][address][unit]") {
    auto expected = fx::bytes_from_hex(fx::ZERO_SEED_PUBLIC);

    auto decoded = decode_address(fx::ZERO_SEED_ADDRESS);
    REQUIRE(decoded.has_value());
    CHECK(std::equal(expected.begin(), expected.end(), decoded->data().begin()));

    SECTION("with the domain suffix") {
        auto host = address_hostname(fx::ZERO_SEED_ADDRESS);
        CHECK(host == std::string(fx::ZERO_SEED_ADDRESS) + ".keynet");
        auto from_host = decode_address(host);
        REQUIRE(from_host.has_value());
        CHECK(*from_host == *decoded);
    }

    SECTION("in upper case") {
        std::string upper(fx::ZERO_SEED_ADDRESS);
        std::transform(upper.begin(), upper.end(), upper.begin(), [](char c) {
            return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        });
        auto from_upper = decode_address(upper);
        REQUIRE(from_upper.has_value());
        CHECK(*from_upper == *decoded);
    }
}

TEST_CASE("decode_address rejects malformed labels", "[crypto][address][unit]") {
    auto pk = fx::bytes_from_hex(fx::ZERO_SEED_PUBLIC);
    auto checksum = address_checksum(pk);
    REQUIRE(checksum.has_value());

    SECTION("wrong length") {
        std::string_view address = fx::ZERO_SEED_ADDRESS;
        CHECK(decode_address(address.substr(0, 55)).error() == AddressError::InvalidLength);
        CHECK(decode_address(std::string(address) + "a").error() == AddressError::InvalidLength);
    }

    SECTION("characters outside the alphabet") {
        std::string address(fx::ZERO_SEED_ADDRESS);
        address[10] = '1';
        CHECK(decode_address(address).error() == AddressError::InvalidEncoding);
    }

    SECTION("wrong version byte") {
        auto v4_checksum = address_checksum(pk, 0x04);
        REQUIRE(v4_checksum.has_value());
        auto address = raw_address(pk, *v4_checksum, 0x04);
        REQUIRE(address.size() == KEYNET_ADDRESS_LEN);
        CHECK(decode_address(address).error() == AddressError::VersionMismatch);
    }

    SECTION("checksum mismatch") {
        auto bad = *checksum;
        bad[1] ^= 0x01;
        CHECK(decode_address(raw_address(pk, bad, 0x03)).error() ==
              AddressError::ChecksumMismatch);
    }

    SECTION("altered public key") {
        auto altered = pk;
        altered[0] ^= 0x80;
        CHECK(decode_address(raw_address(altered, *checksum, 0x03)).error() ==
              AddressError::ChecksumMismatch);
    }
}
