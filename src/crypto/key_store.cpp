#include "keynet/crypto/key_store.hpp"
#include "keynet/crypto/key_codec.hpp"
#include "keynet/util/logging.hpp"
#include <format>
#include <system_error>

namespace keynet::crypto {

namespace {

std::filesystem::path temp_path_for(const std::filesystem::path& path) {
    auto tmp = path;
    tmp += ".tmp";
    return tmp;
}

util::Result<StoredRsaIdentity> read_stored_rsa(const std::filesystem::path& path) {
    auto key = read_rsa_key(path);
    if (!key) {
        return std::unexpected(to_error(key.error(), path));
    }

    auto fingerprint = key->fingerprint();
    if (!fingerprint) {
        return std::unexpected(to_error(fingerprint.error()));
    }
    auto public_pem = key->public_key_pem();
    if (!public_pem) {
        return std::unexpected(to_error(public_pem.error()));
    }

    StoredRsaIdentity stored;
    stored.key = std::move(*key);
    stored.fingerprint = *fingerprint;
    stored.public_key_pem = std::move(*public_pem);
    return stored;
}

void remove_quietly(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        LOG_WARN("Could not remove {}: {}", path.string(), ec.message());
    }
}

util::VoidResult rename_into_place(const std::filesystem::path& from,
                                   const std::filesystem::path& to) {
    std::error_code ec;
    std::filesystem::rename(from, to, ec);
    if (ec) {
        return std::unexpected(util::Error::io_error(
            std::format("Failed to move {} into place: {}", to.string(), ec.message())));
    }
    return {};
}

}  // namespace

KeyStore::KeyStore(std::filesystem::path keys_dir)
    : keys_dir_(std::move(keys_dir)) {}

std::filesystem::path KeyStore::secret_key_path() const {
    return keys_dir_ / ED25519_SECRET_KEY_FILE;
}

std::filesystem::path KeyStore::public_key_path() const {
    return keys_dir_ / ED25519_PUBLIC_KEY_FILE;
}

std::filesystem::path KeyStore::rsa_key_path() const {
    return keys_dir_ / RSA_IDENTITY_KEY_FILE;
}

bool KeyStore::rsa_key_exists() const {
    return std::filesystem::exists(rsa_key_path());
}

util::Result<StoredIdentity> KeyStore::load_or_generate(bool force) {
    bool any_present = std::filesystem::exists(secret_key_path()) ||
                       std::filesystem::exists(public_key_path());

    if (any_present && !force) {
        LOG_INFO("Loading existing Ed25519 identity from {}", keys_dir_.string());
        return load_identity();
    }

    if (force && any_present) {
        LOG_WARN("Regenerating Ed25519 identity in {}; the address will change",
                 keys_dir_.string());
    } else {
        LOG_INFO("No Ed25519 identity in {}, generating a new one", keys_dir_.string());
    }

    auto key = Ed25519IdentityKey::generate();
    if (!key) {
        return std::unexpected(to_error(key.error()));
    }

    KEYNET_TRY_VOID(save_identity(*key));

    StoredIdentity stored;
    stored.key = std::move(*key);
    stored.generated = true;
    return stored;
}

util::Result<StoredIdentity> KeyStore::load_identity() {
    auto secret_path = secret_key_path();
    auto public_path = public_key_path();
    bool have_secret = std::filesystem::exists(secret_path);
    bool have_public = std::filesystem::exists(public_path);

    if (!have_secret && !have_public) {
        return std::unexpected(util::Error(util::Error::Code::NotFound,
            std::format("No Ed25519 identity in {}", keys_dir_.string())));
    }
    if (!have_secret) {
        // Regenerating here would silently rotate the identity
        return std::unexpected(util::Error::corrupt_key_file(
            std::format("{} exists without {}", public_path.string(), secret_path.string())));
    }

    auto secret = read_secret_key(secret_path);
    if (!secret) {
        return std::unexpected(to_error(secret.error(), secret_path));
    }

    StoredIdentity stored;

    if (!have_public) {
        LOG_WARN("{} is missing, re-deriving it from the secret key", public_path.string());
        auto key = Ed25519IdentityKey::from_expanded_secret(*secret);
        secure_zero(secret->data(), secret->size());
        if (!key) {
            return std::unexpected(to_error(key.error()));
        }

        auto written = write_public_key(public_path, key->public_key());
        if (!written) {
            return std::unexpected(to_error(written.error(), public_path));
        }

        stored.key = std::move(*key);
        return stored;
    }

    auto public_key = read_public_key(public_path);
    if (!public_key) {
        secure_zero(secret->data(), secret->size());
        return std::unexpected(to_error(public_key.error(), public_path));
    }

    auto key = Ed25519IdentityKey::from_parts(*secret, *public_key);
    secure_zero(secret->data(), secret->size());
    if (!key) {
        return std::unexpected(to_error(key.error()));
    }

    stored.consistent = key->is_consistent();
    if (!stored.consistent) {
        auto derived = derive_public_key(key->expanded_secret());
        LOG_WARN("Public key file {} does not match the key derived from the secret "
                 "(file {}, derived {}); using the file",
                 public_path.string(), public_key->to_hex(),
                 derived ? derived->to_hex() : std::string("<unavailable>"));
    }

    stored.key = std::move(*key);
    return stored;
}

util::VoidResult KeyStore::save_identity(const Ed25519IdentityKey& key) {
    std::error_code ec;
    std::filesystem::create_directories(keys_dir_, ec);
    if (ec) {
        return std::unexpected(util::Error::io_error(
            std::format("Failed to create {}: {}", keys_dir_.string(), ec.message())));
    }

    auto secret_path = secret_key_path();
    auto public_path = public_key_path();
    auto secret_tmp = temp_path_for(secret_path);
    auto public_tmp = temp_path_for(public_path);

    auto written = write_secret_key(secret_tmp, key);
    if (!written) {
        remove_quietly(secret_tmp);
        return std::unexpected(to_error(written.error(), secret_tmp));
    }

    written = write_public_key(public_tmp, key.public_key());
    if (!written) {
        remove_quietly(secret_tmp);
        remove_quietly(public_tmp);
        return std::unexpected(to_error(written.error(), public_tmp));
    }

    // Drop the old public key first: an interrupted replacement then leaves at
    // most a lone secret, which load_identity re-derives, never a mixed pair
    std::filesystem::remove(public_path, ec);
    if (ec) {
        remove_quietly(secret_tmp);
        remove_quietly(public_tmp);
        return std::unexpected(util::Error::io_error(
            std::format("Failed to remove {}: {}", public_path.string(), ec.message())));
    }

    auto moved = rename_into_place(secret_tmp, secret_path);
    if (!moved) {
        remove_quietly(secret_tmp);
        remove_quietly(public_tmp);
        return moved;
    }

    moved = rename_into_place(public_tmp, public_path);
    if (!moved) {
        // A secret paired with a stale public key file is worse than nothing
        remove_quietly(public_tmp);
        remove_quietly(secret_path);
        remove_quietly(public_path);
        return moved;
    }

    LOG_DEBUG("Wrote {} and {}", secret_path.string(), public_path.string());
    return {};
}

util::Result<StoredRsaIdentity> KeyStore::load_rsa() {
    auto path = rsa_key_path();
    if (!std::filesystem::exists(path)) {
        return std::unexpected(util::Error(util::Error::Code::NotFound,
            std::format("No RSA identity key at {}", path.string())));
    }

    auto stored = KEYNET_TRY(read_stored_rsa(path));
    if (stored.key.bits() != RSA_IDENTITY_BITS) {
        return std::unexpected(util::Error::corrupt_key_file(std::format(
            "{} holds a {}-bit RSA key, expected {}",
            path.string(), stored.key.bits(), RSA_IDENTITY_BITS)));
    }
    return stored;
}

util::Result<StoredRsaIdentity> KeyStore::load_or_find_rsa(
    uint8_t target_first_byte,
    const RsaMatchOptions& options,
    bool force,
    const RsaKeyGenerator& generator
) {
    auto path = rsa_key_path();

    if (!force && rsa_key_exists()) {
        auto stored = KEYNET_TRY(read_stored_rsa(path));
        if (stored.key.bits() != RSA_IDENTITY_BITS) {
            LOG_WARN("RSA identity key {} is {} bits, expected {}; searching for a new key",
                     path.string(), stored.key.bits(), RSA_IDENTITY_BITS);
        } else if (stored.fingerprint[0] == target_first_byte) {
            LOG_INFO("Loaded RSA identity key, fingerprint {}",
                     format_fingerprint(stored.fingerprint));
            return stored;
        } else {
            LOG_WARN("RSA identity key fingerprint starts with {:02x}, expected {:02x}; "
                     "searching for a new key",
                     stored.fingerprint[0], target_first_byte);
        }
    }

    LOG_INFO("Searching for a {}-bit RSA key with fingerprint prefix {:02x} "
             "(at most {} attempts)",
             RSA_IDENTITY_BITS, target_first_byte, options.max_attempts);

    auto match = find_matching_key(target_first_byte, options, generator);
    if (!match) {
        if (match.error() == RsaError::MatchNotFound) {
            LOG_ERROR("No matching RSA key after {} attempts", options.max_attempts);
            return std::unexpected(util::Error::match_not_found(std::format(
                "No RSA key with fingerprint prefix {:02x} after {} attempts",
                target_first_byte, options.max_attempts)));
        }
        return std::unexpected(to_error(match.error()));
    }

    std::error_code ec;
    std::filesystem::create_directories(keys_dir_, ec);
    if (ec) {
        return std::unexpected(util::Error::io_error(
            std::format("Failed to create {}: {}", keys_dir_.string(), ec.message())));
    }

    auto tmp = temp_path_for(path);
    auto written = write_rsa_key(tmp, match->key);
    if (!written) {
        remove_quietly(tmp);
        return std::unexpected(to_error(written.error(), tmp));
    }
    auto moved = rename_into_place(tmp, path);
    if (!moved) {
        remove_quietly(tmp);
        return std::unexpected(moved.error());
    }

    LOG_INFO("Found RSA identity key after {} attempts, fingerprint {}",
             match->attempts, format_fingerprint(match->fingerprint));

    secure_zero(match->private_key_pem.data(), match->private_key_pem.size());

    StoredRsaIdentity stored;
    stored.key = std::move(match->key);
    stored.fingerprint = match->fingerprint;
    stored.public_key_pem = std::move(match->public_key_pem);
    stored.attempts = match->attempts;
    stored.generated = true;
    return stored;
}

util::Error to_error(KeyFileError err, const std::filesystem::path& path,
                     std::source_location loc) {
    auto message = std::format("{}: {}", key_file_error_message(err), path.string());
    switch (err) {
        case KeyFileError::CorruptKeyFile:
            return util::Error::corrupt_key_file(std::move(message), loc);
        case KeyFileError::PermissionError:
            return util::Error(util::Error::Code::PermissionError, std::move(message), loc);
        case KeyFileError::InvalidKeyLength:
            return util::Error::invalid_key_length(std::move(message), loc);
        case KeyFileError::KeyError:
            return util::Error::crypto_error(std::move(message), loc);
        case KeyFileError::IoError:
        default:
            return util::Error::io_error(std::move(message), loc);
    }
}

util::Error to_error(KeyError err, std::source_location loc) {
    if (err == KeyError::InvalidKeyLength) {
        return util::Error::invalid_key_length(key_error_message(err), loc);
    }
    return util::Error::crypto_error(key_error_message(err), loc);
}

util::Error to_error(RsaError err, std::source_location loc) {
    switch (err) {
        case RsaError::MatchNotFound:
            return util::Error::match_not_found(rsa_error_message(err), loc);
        case RsaError::InvalidArgument:
            return util::Error::invalid_argument(rsa_error_message(err), loc);
        default:
            return util::Error::crypto_error(rsa_error_message(err), loc);
    }
}

}  // namespace keynet::crypto
