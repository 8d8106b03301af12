#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace keynet::crypto {

// Key sizes
constexpr size_t ED25519_PUBLIC_KEY_LEN = 32;
constexpr size_t ED25519_EXPANDED_SECRET_LEN = 32;  // Clamped scalar, as Tor stores it
constexpr size_t ED25519_SEED_LEN = 32;
constexpr size_t ED25519_SECRET_TRAILER_LEN = 32;   // Hash prefix following the scalar

enum class KeyError {
    GenerationFailed,
    InvalidKeyLength,
    InvalidKey,
    DerivationFailed,
    ParseError,
    OpenSSLError,
};

// Ed25519 public key (relay identity, and the source of the keynet address)
class Ed25519PublicKey {
public:
    static constexpr size_t SIZE = ED25519_PUBLIC_KEY_LEN;

    Ed25519PublicKey() = default;
    explicit Ed25519PublicKey(std::array<uint8_t, SIZE> data);
    explicit Ed25519PublicKey(std::span<const uint8_t> data);

    [[nodiscard]] const std::array<uint8_t, SIZE>& data() const { return data_; }
    [[nodiscard]] std::span<const uint8_t> as_span() const { return data_; }
    [[nodiscard]] uint8_t first_byte() const { return data_[0]; }

    [[nodiscard]] std::string to_hex() const;

    // Base64 without trailing '=' padding, the form Tor prints for ed25519 ids
    [[nodiscard]] std::string to_base64() const;

    [[nodiscard]] static std::expected<Ed25519PublicKey, KeyError>
    from_bytes(std::span<const uint8_t> data);

    bool operator==(const Ed25519PublicKey&) const = default;

private:
    std::array<uint8_t, SIZE> data_{};
};

// Tor-style Ed25519 identity: a clamped 32-byte scalar (the "expanded secret")
// plus its public key. Tor keeps the expanded scalar on disk, never the seed.
class Ed25519IdentityKey {
public:
    static constexpr size_t SECRET_SIZE = ED25519_EXPANDED_SECRET_LEN;
    static constexpr size_t SEED_SIZE = ED25519_SEED_LEN;

    Ed25519IdentityKey() = default;
    ~Ed25519IdentityKey();

    // Disable copying, allow moving
    Ed25519IdentityKey(const Ed25519IdentityKey&) = delete;
    Ed25519IdentityKey& operator=(const Ed25519IdentityKey&) = delete;
    Ed25519IdentityKey(Ed25519IdentityKey&&) noexcept;
    Ed25519IdentityKey& operator=(Ed25519IdentityKey&&) noexcept;

    // Fresh identity from a random seed
    [[nodiscard]] static std::expected<Ed25519IdentityKey, KeyError> generate();

    // Deterministic identity from a caller-supplied seed
    [[nodiscard]] static std::expected<Ed25519IdentityKey, KeyError>
    from_seed(std::span<const uint8_t> seed);

    // Identity from a stored expanded secret; the public key is re-derived
    [[nodiscard]] static std::expected<Ed25519IdentityKey, KeyError>
    from_expanded_secret(std::span<const uint8_t> expanded_secret);

    // Identity from both halves as read from disk; no consistency check
    [[nodiscard]] static std::expected<Ed25519IdentityKey, KeyError>
    from_parts(std::span<const uint8_t> expanded_secret, const Ed25519PublicKey& public_key);

    [[nodiscard]] std::span<const uint8_t> expanded_secret() const { return secret_; }
    [[nodiscard]] const Ed25519PublicKey& public_key() const { return public_key_; }
    [[nodiscard]] bool valid() const { return initialized_; }

    // Whether public_key() is what derive_public_key() yields for the secret
    [[nodiscard]] bool is_consistent() const;

    // Upper half of SHA-512(expanded secret), stored after the scalar in the secret key file
    [[nodiscard]] std::expected<std::array<uint8_t, ED25519_SECRET_TRAILER_LEN>, KeyError>
    secret_trailer() const;

private:
    std::array<uint8_t, SECRET_SIZE> secret_{};
    Ed25519PublicKey public_key_;
    bool initialized_{false};

    void clear();
};

// SHA-512 the seed, keep the low 32 bytes and clamp them
[[nodiscard]] std::expected<std::array<uint8_t, ED25519_EXPANDED_SECRET_LEN>, KeyError>
expand_seed(std::span<const uint8_t> seed);

// Clear bits 0-2, clear bit 255, set bit 254
void clamp_scalar(std::span<uint8_t, 32> scalar);

// Little-endian scalar mod the group order l = 2^252 + 27742317777372353535851937790883648493
[[nodiscard]] std::expected<std::array<uint8_t, 32>, KeyError>
reduce_scalar(std::span<const uint8_t> scalar);

// Public key for a stored expanded secret: (secret mod l) * B, compressed
[[nodiscard]] std::expected<Ed25519PublicKey, KeyError>
derive_public_key(std::span<const uint8_t> expanded_secret);

// Whether derive_public_key(expanded_secret) equals public_key byte for byte
[[nodiscard]] std::expected<bool, KeyError> check_key_pair(
    std::span<const uint8_t> expanded_secret,
    std::span<const uint8_t> public_key
);

[[nodiscard]] std::string key_error_message(KeyError err);

}  // namespace keynet::crypto
