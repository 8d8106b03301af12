#pragma once

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

// Tor on-disk ed25519 key files: 32-byte header, then key material
constexpr size_t TOR_KEY_HEADER_LEN = 32;
constexpr size_t TOR_SECRET_KEY_FILE_LEN = 96;  // header + scalar + hash prefix
constexpr size_t TOR_PUBLIC_KEY_FILE_LEN = 64;  // header + public key

// Headers are the ASCII tag padded with NUL bytes to 32 bytes
constexpr std::string_view TOR_SECRET_KEY_TAG = "== ed25519v1-secret: type0 ==";
constexpr std::string_view TOR_PUBLIC_KEY_TAG = "== ed25519v1-public: type0 ==";

enum class KeyFileError {
    IoError,
    CorruptKeyFile,     // wrong size or header
    PermissionError,
    InvalidKeyLength,
    KeyError,           // key material could not be processed
};

[[nodiscard]] std::string key_file_error_message(KeyFileError err);

// In-memory framing
[[nodiscard]] std::expected<std::array<uint8_t, TOR_SECRET_KEY_FILE_LEN>, KeyFileError>
encode_secret_key_file(const Ed25519IdentityKey& key);

[[nodiscard]] std::array<uint8_t, TOR_PUBLIC_KEY_FILE_LEN>
encode_public_key_file(const Ed25519PublicKey& key);

// Validate length and header, return bytes 32..64
[[nodiscard]] std::expected<std::array<uint8_t, ED25519_EXPANDED_SECRET_LEN>, KeyFileError>
parse_secret_key_file(std::span<const uint8_t> contents);

[[nodiscard]] std::expected<Ed25519PublicKey, KeyFileError>
parse_public_key_file(std::span<const uint8_t> contents);

// File I/O. Secret files are created with mode 0600.
[[nodiscard]] std::expected<void, KeyFileError>
write_secret_key(const std::filesystem::path& path, const Ed25519IdentityKey& key);

[[nodiscard]] std::expected<void, KeyFileError>
write_public_key(const std::filesystem::path& path, const Ed25519PublicKey& key);

[[nodiscard]] std::expected<std::array<uint8_t, ED25519_EXPANDED_SECRET_LEN>, KeyFileError>
read_secret_key(const std::filesystem::path& path);

[[nodiscard]] std::expected<Ed25519PublicKey, KeyFileError>
read_public_key(const std::filesystem::path& path);

// Shared helpers for every key artifact this project writes
[[nodiscard]] std::expected<void, KeyFileError>
write_key_file(const std::filesystem::path& path, std::span<const uint8_t> data, bool owner_only);

// Files larger than max_size are CorruptKeyFile and are not read
[[nodiscard]] std::expected<std::vector<uint8_t>, KeyFileError>
read_key_file(const std::filesystem::path& path, size_t max_size);

}  // namespace keynet::crypto
