#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace keynet::crypto {

// Hash sizes
constexpr size_t SHA1_DIGEST_LEN = 20;
constexpr size_t SHA3_256_DIGEST_LEN = 32;
constexpr size_t SHA512_DIGEST_LEN = 64;

enum class HashError {
    InvalidLength,
    InvalidEncoding,
    UpdateFailed,
    FinalizeFailed,
    OpenSSLError,
};

enum class HashAlgorithm {
    Sha1,      // RSA identity fingerprints
    Sha512,    // Ed25519 seed expansion
    Sha3_256,  // address checksum
};

[[nodiscard]] constexpr size_t digest_length(HashAlgorithm alg) {
    switch (alg) {
        case HashAlgorithm::Sha1: return SHA1_DIGEST_LEN;
        case HashAlgorithm::Sha512: return SHA512_DIGEST_LEN;
        case HashAlgorithm::Sha3_256: return SHA3_256_DIGEST_LEN;
    }
    return 0;
}

// Incremental message digest over an EVP context
class Hasher {
public:
    explicit Hasher(HashAlgorithm alg);
    ~Hasher();

    // Disable copying, allow moving
    Hasher(const Hasher&) = delete;
    Hasher& operator=(const Hasher&) = delete;
    Hasher(Hasher&&) noexcept;
    Hasher& operator=(Hasher&&) noexcept;

    [[nodiscard]] HashAlgorithm algorithm() const { return alg_; }

    [[nodiscard]] std::expected<void, HashError> update(std::span<const uint8_t> data);
    [[nodiscard]] std::expected<void, HashError> update(std::string_view data);

    // Finalize and get digest (resets internal state)
    [[nodiscard]] std::expected<std::vector<uint8_t>, HashError> finalize();

private:
    struct Impl;
    HashAlgorithm alg_;
    std::unique_ptr<Impl> impl_;
};

// One-shot digests
[[nodiscard]] std::expected<std::array<uint8_t, SHA1_DIGEST_LEN>, HashError>
sha1(std::span<const uint8_t> data);

[[nodiscard]] std::expected<std::array<uint8_t, SHA512_DIGEST_LEN>, HashError>
sha512(std::span<const uint8_t> data);

[[nodiscard]] std::expected<std::array<uint8_t, SHA3_256_DIGEST_LEN>, HashError>
sha3_256(std::span<const uint8_t> data);

// Hex encoding/decoding (lowercase output)
[[nodiscard]] std::string to_hex(std::span<const uint8_t> data);
[[nodiscard]] std::expected<std::vector<uint8_t>, HashError> from_hex(const std::string& hex);

// Base64 (RFC 4648, padded, no line breaks)
[[nodiscard]] std::string to_base64(std::span<const uint8_t> data);
[[nodiscard]] std::expected<std::vector<uint8_t>, HashError> from_base64(const std::string& b64);

// Base32 (RFC 4648 alphabet in lowercase, no padding)
[[nodiscard]] std::string to_base32(std::span<const uint8_t> data);
[[nodiscard]] std::expected<std::vector<uint8_t>, HashError> from_base32(std::string_view b32);


[[nodiscard]] bool constant_time_compare(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b
);

// Secure memory operations
void secure_zero(void* ptr, size_t len);
[[nodiscard]] std::vector<uint8_t> random_bytes(size_t len);

}  // namespace keynet::crypto
