#include "keynet/core/setup.hpp"
#include "keynet/crypto/address.hpp"
#include "keynet/crypto/hash.hpp"
#include "keynet/crypto/key_codec.hpp"
#include "keynet/crypto/key_store.hpp"
#include "keynet/crypto/pem.hpp"
#include "keynet/util/logging.hpp"
#include <format>

namespace keynet::core {

namespace {

util::Result<std::string> address_for(const crypto::Ed25519PublicKey& key) {
    auto address = crypto::encode_address(key);
    if (!address) {
        return std::unexpected(crypto::to_error(address.error()));
    }
    return std::move(*address);
}

util::VoidResult write_pem(const std::filesystem::path& path,
                           const crypto::Ed25519IdentityKey& key) {
    auto written = crypto::write_pkcs8_pem(path, key.expanded_secret());
    if (!written) {
        return std::unexpected(crypto::to_error(written.error(), path));
    }
    LOG_INFO("Wrote Ed25519 TLS key to {}", path.string());
    return {};
}

}  // namespace

KeynetSetup::KeynetSetup(SetupOptions options)
    : options_(std::move(options)) {}

util::Result<SetupResult> KeynetSetup::run() {
    if (options_.keys_dir.empty()) {
        return std::unexpected(util::Error::invalid_argument("Key directory is not set"));
    }
    if (options_.pem_path.empty()) {
        return std::unexpected(util::Error::invalid_argument("PEM output path is not set"));
    }

    crypto::KeyStore store(options_.keys_dir);
    auto identity = KEYNET_TRY(store.load_or_generate(options_.force));
    const auto& public_key = identity.key.public_key();

    SetupResult result;
    result.address = KEYNET_TRY(address_for(public_key));
    result.ed25519_fingerprint = public_key.to_base64();
    result.public_key_hex = public_key.to_hex();
    result.generated = identity.generated;
    result.consistent = identity.consistent;

    LOG_INFO("Ed25519 identity: {}", result.ed25519_fingerprint);
    LOG_INFO("Public key: {}", result.public_key_hex);
    LOG_INFO("Address: {}", crypto::address_hostname(result.address));
    if (identity.generated) {
        LOG_WARN("The relay daemon re-derives its public key on first start; "
                 "re-read the address with 'keynet address' afterwards");
    }

    KEYNET_TRY_VOID(write_pem(options_.pem_path, identity.key));

    if (options_.rsa_enabled) {
        // A regenerated identity needs a new RSA match as well
        auto rsa = KEYNET_TRY(store.load_or_find_rsa(
            public_key.first_byte(), options_.rsa, options_.force, options_.rsa_generator));

        result.rsa_fingerprint_hex = crypto::to_hex(rsa.fingerprint);
        result.rsa_attempts = rsa.attempts;
        LOG_INFO("RSA fingerprint: {}", crypto::format_fingerprint(rsa.fingerprint));
    } else {
        LOG_DEBUG("RSA identity disabled");
    }

    return result;
}

util::VoidResult KeynetSetup::export_pem() {
    if (options_.pem_path.empty()) {
        return std::unexpected(util::Error::invalid_argument("PEM output path is not set"));
    }

    crypto::KeyStore store(options_.keys_dir);
    auto identity = KEYNET_TRY(store.load_identity());
    return write_pem(options_.pem_path, identity.key);
}

util::Result<bool> KeynetSetup::check() {
    crypto::KeyStore store(options_.keys_dir);

    auto secret_path = store.secret_key_path();
    auto secret = crypto::read_secret_key(secret_path);
    if (!secret) {
        return std::unexpected(crypto::to_error(secret.error(), secret_path));
    }

    auto public_path = store.public_key_path();
    auto public_key = crypto::read_public_key(public_path);
    if (!public_key) {
        crypto::secure_zero(secret->data(), secret->size());
        return std::unexpected(crypto::to_error(public_key.error(), public_path));
    }

    auto valid = crypto::check_key_pair(*secret, public_key->as_span());
    crypto::secure_zero(secret->data(), secret->size());
    if (!valid) {
        return std::unexpected(crypto::to_error(valid.error()));
    }

    if (*valid) {
        LOG_INFO("Key pair in {} is consistent", options_.keys_dir.string());
    } else {
        LOG_WARN("Public key in {} does not match the secret key",
                 options_.keys_dir.string());
    }
    return *valid;
}

util::Result<std::string> KeynetSetup::address() {
    crypto::KeyStore store(options_.keys_dir);
    auto path = store.public_key_path();

    auto public_key = crypto::read_public_key(path);
    if (!public_key) {
        return std::unexpected(crypto::to_error(public_key.error(), path));
    }
    return address_for(*public_key);
}

util::Result<FingerprintReport> KeynetSetup::fingerprint() {
    crypto::KeyStore store(options_.keys_dir);
    auto path = store.public_key_path();

    auto public_key = crypto::read_public_key(path);
    if (!public_key) {
        return std::unexpected(crypto::to_error(public_key.error(), path));
    }

    auto rsa = KEYNET_TRY(store.load_rsa());

    FingerprintReport report;
    report.public_key_hex = public_key->to_hex();
    report.ed25519_first_byte = public_key->first_byte();
    report.rsa_fingerprint_hex = crypto::to_hex(rsa.fingerprint);
    report.rsa_fingerprint_base64 = crypto::to_base64(rsa.fingerprint);
    report.rsa_fingerprint_grouped = crypto::format_fingerprint(rsa.fingerprint);
    report.prefix_matches = rsa.fingerprint[0] == report.ed25519_first_byte;
    return report;
}

}  // namespace keynet::core
