#pragma once

#include "keynet/crypto/keys.hpp"
#include "keynet/crypto/rsa_identity.hpp"
#include "keynet/util/result.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace keynet::crypto {

// File names inside the key directory, as the relay daemon expects them
constexpr std::string_view ED25519_SECRET_KEY_FILE = "ed25519_master_id_secret_key";
constexpr std::string_view ED25519_PUBLIC_KEY_FILE = "ed25519_master_id_public_key";
constexpr std::string_view RSA_IDENTITY_KEY_FILE = "secret_id_key";

// Ed25519 identity as established by the store
struct StoredIdentity {
    // Secret from the secret key file, public key from the public key file
    Ed25519IdentityKey key;
    bool generated{false};
    // False when the public key file disagrees with our derivation
    bool consistent{true};
};

// RSA identity as established by the store
struct StoredRsaIdentity {
    RsaIdentityKey key;
    RsaFingerprint fingerprint{};
    std::string public_key_pem;
    uint32_t attempts{0};  // 0 when loaded from disk
    bool generated{false};
};

// Persistent storage for the relay identity keys in a single key directory
class KeyStore {
public:
    explicit KeyStore(std::filesystem::path keys_dir);

    [[nodiscard]] std::filesystem::path secret_key_path() const;
    [[nodiscard]] std::filesystem::path public_key_path() const;
    [[nodiscard]] std::filesystem::path rsa_key_path() const;

    [[nodiscard]] bool rsa_key_exists() const;

    // Load the Ed25519 identity, or generate and persist a new one when none
    // exists or force is set
    [[nodiscard]] util::Result<StoredIdentity> load_or_generate(bool force = false);

    // Load without generating. A missing public key file is rewritten from the
    // secret; a public key file without its secret is CorruptKeyFile.
    [[nodiscard]] util::Result<StoredIdentity> load_identity();

    // Write both key files via temporary files; on failure neither is left behind.
    // The old public key file is removed before the secret is replaced.
    [[nodiscard]] util::VoidResult save_identity(const Ed25519IdentityKey& key);

    // Reuse secret_id_key when its fingerprint starts with target_first_byte,
    // otherwise search for a new key and replace the file
    [[nodiscard]] util::Result<StoredRsaIdentity> load_or_find_rsa(
        uint8_t target_first_byte,
        const RsaMatchOptions& options = {},
        bool force = false,
        const RsaKeyGenerator& generator = {}
    );

    [[nodiscard]] util::Result<StoredRsaIdentity> load_rsa();

private:
    std::filesystem::path keys_dir_;
};

// Conversions from module errors to util::Error
[[nodiscard]] util::Error to_error(
    KeyFileError err,
    const std::filesystem::path& path,
    std::source_location loc = std::source_location::current());

[[nodiscard]] util::Error to_error(
    KeyError err,
    std::source_location loc = std::source_location::current());

[[nodiscard]] util::Error to_error(
    RsaError err,
    std::source_location loc = std::source_location::current());

}  // namespace keynet::crypto
