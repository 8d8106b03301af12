#pragma once

#include "keynet/crypto/hash.hpp"
#include "keynet/crypto/key_codec.hpp"
#include <array>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace keynet::crypto {

// Legacy relay identity keys are 1024-bit RSA
constexpr int RSA_IDENTITY_BITS = 1024;
constexpr uint32_t RSA_DEFAULT_MAX_ATTEMPTS = 10000;
constexpr size_t RSA_FINGERPRINT_LEN = SHA1_DIGEST_LEN;
constexpr size_t RSA_KEY_FILE_MAX_LEN = 16 * 1024;  // far above any PKCS#1 PEM we accept

using RsaFingerprint = std::array<uint8_t, RSA_FINGERPRINT_LEN>;

enum class RsaError {
    GenerationFailed,
    EncodeFailed,
    ParseError,
    MatchNotFound,
    InvalidArgument,
};

[[nodiscard]] std::string rsa_error_message(RsaError err);

// RSA identity keypair
class RsaIdentityKey {
public:
    RsaIdentityKey() = default;
    ~RsaIdentityKey();

    // Disable copying, allow moving
    RsaIdentityKey(const RsaIdentityKey&) = delete;
    RsaIdentityKey& operator=(const RsaIdentityKey&) = delete;
    RsaIdentityKey(RsaIdentityKey&& other) noexcept;
    RsaIdentityKey& operator=(RsaIdentityKey&& other) noexcept;

    [[nodiscard]] static std::expected<RsaIdentityKey, RsaError>
    generate(int bits = RSA_IDENTITY_BITS);

    // Accepts PKCS#1 ("RSA PRIVATE KEY") or PKCS#8 PEM
    [[nodiscard]] static std::expected<RsaIdentityKey, RsaError>
    from_pem(std::string_view pem);

    [[nodiscard]] bool valid() const { return pkey_ != nullptr; }
    [[nodiscard]] int bits() const;

    // PKCS#1 RSAPrivateKey PEM
    [[nodiscard]] std::expected<std::string, RsaError> private_key_pem() const;

    // PKCS#1 RSAPublicKey DER, the encoding the fingerprint is taken over
    [[nodiscard]] std::expected<std::vector<uint8_t>, RsaError> public_key_der() const;

    [[nodiscard]] std::expected<std::string, RsaError> public_key_pem() const;

    // SHA-1 of public_key_der()
    [[nodiscard]] std::expected<RsaFingerprint, RsaError> fingerprint() const;

private:
    void* pkey_{nullptr};  // EVP_PKEY*

    explicit RsaIdentityKey(void* pkey) : pkey_(pkey) {}
};

[[nodiscard]] std::expected<RsaFingerprint, RsaError>
compute_fingerprint(std::span<const uint8_t> public_key_der);

// Uppercase hex in space-separated groups of four: "ABCD 0123 ..."
[[nodiscard]] std::string format_fingerprint(std::span<const uint8_t> fingerprint);

// Candidates are always RSA_IDENTITY_BITS; the daemon loads no other size
struct RsaMatchOptions {
    uint32_t max_attempts{RSA_DEFAULT_MAX_ATTEMPTS};
};

struct RsaMatch {
    RsaIdentityKey key;
    std::string private_key_pem;
    std::string public_key_pem;
    RsaFingerprint fingerprint{};
    uint32_t attempts{0};
};

// Source of candidate keys for the search
using RsaKeyGenerator = std::function<std::expected<RsaIdentityKey, RsaError>(int bits)>;

// Generate keys until fingerprint[0] == target_first_byte, at most
// options.max_attempts times. An empty generator uses RsaIdentityKey::generate.
// A candidate of any other modulus size fails the search with GenerationFailed.
[[nodiscard]] std::expected<RsaMatch, RsaError> find_matching_key(
    uint8_t target_first_byte,
    const RsaMatchOptions& options = {},
    const RsaKeyGenerator& generator = {}
);

// secret_id_key persistence (PKCS#1 PEM, mode 0600)
[[nodiscard]] std::expected<void, KeyFileError>
write_rsa_key(const std::filesystem::path& path, const RsaIdentityKey& key);

[[nodiscard]] std::expected<RsaIdentityKey, KeyFileError>
read_rsa_key(const std::filesystem::path& path);

}  // namespace keynet::crypto
