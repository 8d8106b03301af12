#pragma once

#include "keynet/crypto/key_codec.hpp"
#include "keynet/crypto/keys.hpp"
#include <array>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace keynet::crypto {

constexpr size_t PEM_LINE_WIDTH = 64;
constexpr size_t ED25519_PKCS8_DER_LEN = 48;

constexpr std::string_view PEM_PRIVATE_KEY = "PRIVATE KEY";
constexpr std::string_view PEM_RSA_PRIVATE_KEY = "RSA PRIVATE KEY";
constexpr std::string_view PEM_RSA_PUBLIC_KEY = "RSA PUBLIC KEY";

enum class PemError {
    MissingBoundary,
    InvalidBase64,
};

[[nodiscard]] std::string pem_error_message(PemError err);

// "-----BEGIN <label>-----", base64 body in 64-character lines, "-----END <label>-----"
[[nodiscard]] std::string pem_encode(std::string_view label, std::span<const uint8_t> der);

// Body of the first block with the given label
[[nodiscard]] std::expected<std::vector<uint8_t>, PemError>
pem_decode(std::string_view label, std::string_view pem);

// PrivateKeyInfo { version 0, AlgorithmIdentifier { 1.3.101.112 },
//                  OCTET STRING { OCTET STRING { key } } }
[[nodiscard]] std::expected<std::array<uint8_t, ED25519_PKCS8_DER_LEN>, KeyError>
ed25519_pkcs8_der(std::span<const uint8_t> expanded_secret);

[[nodiscard]] std::expected<std::string, KeyError>
export_pkcs8_pem(std::span<const uint8_t> expanded_secret);

// Writes the PKCS#8 PEM with mode 0600
[[nodiscard]] std::expected<void, KeyFileError>
write_pkcs8_pem(const std::filesystem::path& path, std::span<const uint8_t> expanded_secret);

}  // namespace keynet::crypto
