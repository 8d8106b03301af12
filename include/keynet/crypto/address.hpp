#pragma once

#include "keynet/crypto/keys.hpp"
#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>

namespace keynet::crypto {

// Onion-v3 style label: base32(pubkey || checksum[2] || version)
constexpr uint8_t KEYNET_ADDRESS_VERSION = 0x03;
constexpr size_t KEYNET_CHECKSUM_LEN = 2;
constexpr size_t KEYNET_ADDRESS_BYTES = ED25519_PUBLIC_KEY_LEN + KEYNET_CHECKSUM_LEN + 1;
constexpr size_t KEYNET_ADDRESS_LEN = 56;
constexpr std::string_view KEYNET_CHECKSUM_PREFIX = ".onion checksum";
constexpr std::string_view KEYNET_DOMAIN_SUFFIX = ".keynet";

enum class AddressError {
    InvalidLength,
    InvalidEncoding,
    VersionMismatch,
    ChecksumMismatch,
    HashFailed,
};

[[nodiscard]] std::string address_error_message(AddressError err);

// First two bytes of SHA3-256(".onion checksum" || pubkey || version)
[[nodiscard]] std::expected<std::array<uint8_t, KEYNET_CHECKSUM_LEN>, AddressError>
address_checksum(std::span<const uint8_t> public_key, uint8_t version = KEYNET_ADDRESS_VERSION);

// 56-character lowercase label for a 32-byte public key
[[nodiscard]] std::expected<std::string, KeyError>
encode_address(std::span<const uint8_t> public_key);

[[nodiscard]] std::expected<std::string, KeyError>
encode_address(const Ed25519PublicKey& public_key);

// Parse a label (optionally followed by ".keynet") and verify version and checksum
[[nodiscard]] std::expected<Ed25519PublicKey, AddressError>
decode_address(std::string_view address);

// "<label>.keynet"
[[nodiscard]] std::string address_hostname(std::string_view address);

}  // namespace keynet::crypto
