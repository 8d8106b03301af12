#pragma once

#include "keynet/crypto/rsa_identity.hpp"
#include "keynet/util/result.hpp"
#include <cstdint>
#include <filesystem>
#include <string>

namespace keynet::core {

// Version information
struct VersionInfo {
    static constexpr uint8_t MAJOR = 1;
    static constexpr uint8_t MINOR = 0;
    static constexpr uint8_t PATCH = 0;

    [[nodiscard]] static std::string to_string() {
        return std::to_string(MAJOR) + "." +
               std::to_string(MINOR) + "." +
               std::to_string(PATCH);
    }
};

// Everything a run needs, passed in explicitly
struct SetupOptions {
    std::filesystem::path keys_dir;
    std::filesystem::path pem_path;
    bool force{false};
    bool rsa_enabled{true};
    crypto::RsaMatchOptions rsa;
    crypto::RsaKeyGenerator rsa_generator;  // empty: real key generation
};

// Identity established by a setup run
struct SetupResult {
    std::string address;              // 56-character label
    std::string ed25519_fingerprint;  // unpadded base64 of the public key
    std::string public_key_hex;
    std::string rsa_fingerprint_hex;  // empty when RSA is disabled
    uint32_t rsa_attempts{0};         // 0 when the RSA key was loaded
    bool generated{false};            // Ed25519 identity created by this run
    bool consistent{true};            // public key file matches the derivation
};

struct FingerprintReport {
    std::string public_key_hex;
    uint8_t ed25519_first_byte{0};
    std::string rsa_fingerprint_hex;
    std::string rsa_fingerprint_base64;
    std::string rsa_fingerprint_grouped;
    bool prefix_matches{false};
};

// Key directory orchestration: identity, address, TLS PEM, RSA identity
class KeynetSetup {
public:
    explicit KeynetSetup(SetupOptions options);

    [[nodiscard]] const SetupOptions& options() const { return options_; }

    // Load or generate the identity, write the PEM, establish the RSA key
    [[nodiscard]] util::Result<SetupResult> run();

    // Write the PEM for the existing identity
    [[nodiscard]] util::VoidResult export_pem();

    // Whether the stored secret derives the stored public key
    [[nodiscard]] util::Result<bool> check();

    // Address of the public key file as it is on disk now
    [[nodiscard]] util::Result<std::string> address();

    [[nodiscard]] util::Result<FingerprintReport> fingerprint();

private:
    SetupOptions options_;
};

}  // namespace keynet::core
