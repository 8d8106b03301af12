#include <catch2/catch_all.hpp>
#include "keynet/crypto/key_codec.hpp"
#include "keynet/crypto/key_store.hpp"
#include "fixtures/key_fixtures.hpp"
#include "fixtures/temp_dir.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string_view>

using namespace keynet::crypto;
using keynet::test::TempDir;
using keynet::util::Error;
namespace fx = keynet::test::fixtures;
namespace fs = std::filesystem;

namespace {

// Generator handing out copies of one fixed key
struct FixedRsaKey {
    std::string pem;
    RsaFingerprint fingerprint{};
    uint32_t calls{0};

    FixedRsaKey() {
        auto key = RsaIdentityKey::generate();
        REQUIRE(key.has_value());
        pem = key->private_key_pem().value();
        fingerprint = key->fingerprint().value();
    }

    RsaKeyGenerator generator() {
        return [this](int) {
            ++calls;
            return RsaIdentityKey::from_pem(pem);
        };
    }
};

bool has_temp_files(const fs::path& dir) {
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.path().extension() == ".tmp") {
            return true;
        }
    }
    return false;
}

}  // namespace

TEST_CASE("KeyStore generates keys on first run", "[crypto][keystore][unit]") {
    TempDir tmp;
    KeyStore store(tmp.path / "keys");

    auto result = store.load_or_generate();
    REQUIRE(result.has_value());
    CHECK(result->generated);
    CHECK(result->consistent);
    CHECK(result->key.is_consistent());

    CHECK(fs::file_size(tmp.path / "keys" / "ed25519_master_id_secret_key") == 96);
    CHECK(fs::file_size(tmp.path / "keys" / "ed25519_master_id_public_key") == 64);
    CHECK_FALSE(has_temp_files(tmp.path / "keys"));

    auto perms = fs::status(store.secret_key_path()).permissions();
    CHECK((perms & (fs::perms::group_all | fs::perms::others_all)) == fs::perms::none);
}

TEST_CASE("KeyStore loads existing keys", "[crypto][keystore][unit]") {
    TempDir tmp;

    Ed25519PublicKey first_pubkey;
    {
        KeyStore store(tmp.path);
        auto result = store.load_or_generate();
        REQUIRE(result.has_value());
        first_pubkey = result->key.public_key();
    }

    {
        KeyStore store(tmp.path);
        auto result = store.load_or_generate();
        REQUIRE(result.has_value());
        CHECK_FALSE(result->generated);
        CHECK(result->key.public_key() == first_pubkey);
    }
}

TEST_CASE("KeyStore force regenerates the identity", "[crypto][keystore][unit]") {
    TempDir tmp;
    KeyStore store(tmp.path);

    auto first = store.load_or_generate();
    REQUIRE(first.has_value());
    auto second = store.load_or_generate(true);
    REQUIRE(second.has_value());

    CHECK(second->generated);
    CHECK(second->key.public_key() != first->key.public_key());

    auto on_disk = read_public_key(store.public_key_path());
    REQUIRE(on_disk.has_value());
    CHECK(*on_disk == second->key.public_key());
}

TEST_CASE("KeyStore re-derives a missing public key file", "[crypto][keystore][unit]") {
    TempDir tmp;
    KeyStore store(tmp.path);

    auto key = Ed25519IdentityKey::from_seed(fx::ZERO_SEED);
    REQUIRE(key.has_value());
    REQUIRE(write_secret_key(store.secret_key_path(), *key).has_value());

    auto result = store.load_or_generate();
    REQUIRE(result.has_value());
    CHECK_FALSE(result->generated);
    CHECK(result->key.public_key().to_hex() == fx::ZERO_SEED_PUBLIC);

    auto written = read_public_key(store.public_key_path());
    REQUIRE(written.has_value());
    CHECK(written->to_hex() == fx::ZERO_SEED_PUBLIC);
}

TEST_CASE("KeyStore refuses a public key without its secret", "[crypto][keystore][unit]") {
    TempDir tmp;
    KeyStore store(tmp.path);

    auto key = Ed25519IdentityKey::from_seed(fx::ZERO_SEED);
    REQUIRE(key.has_value());
    REQUIRE(write_public_key(store.public_key_path(), key->public_key()).has_value());

    auto result = store.load_or_generate();
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == Error::Code::CorruptKeyFile);
    CHECK_FALSE(fs::exists(store.secret_key_path()));
}

TEST_CASE("KeyStore never overwrites a corrupt secret key file", "[crypto][keystore][unit]") {
    TempDir tmp;
    KeyStore store(tmp.path);
    REQUIRE(store.load_or_generate().has_value());

    // Truncate the secret key file
    fs::resize_file(store.secret_key_path(), 50);

    auto result = store.load_or_generate();
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == Error::Code::CorruptKeyFile);
    CHECK(fs::file_size(store.secret_key_path()) == 50);
}

TEST_CASE("KeyStore trusts the public key file when it disagrees", "[crypto][keystore][unit]") {
    TempDir tmp;
    KeyStore store(tmp.path);

    auto key = Ed25519IdentityKey::from_seed(fx::ZERO_SEED);
    auto other = Ed25519IdentityKey::from_seed(fx::COUNTING_SEED);
    REQUIRE(key.has_value());
    REQUIRE(other.has_value());
    REQUIRE(write_secret_key(store.secret_key_path(), *key).has_value());
    REQUIRE(write_public_key(store.public_key_path(), other->public_key()).has_value());

    auto result = store.load_identity();
    REQUIRE(result.has_value());
    CHECK_FALSE(result->consistent);
    CHECK(result->key.public_key().to_hex() == fx::COUNTING_SEED_PUBLIC);
    CHECK(to_hex(result->key.expanded_secret()) == fx::ZERO_SEED_EXPANDED);
}

TEST_CASE("KeyStore load_identity without keys is NotFound", "[crypto][keystore][unit]") {
    TempDir tmp;
    KeyStore store(tmp.path);

    auto result = store.load_identity();
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == Error::Code::NotFound);
}

TEST_CASE("KeyStore leaves neither file behind on a failed save", "[crypto][keystore][unit]") {
    TempDir tmp;
    KeyStore store(tmp.path);

    // A non-empty directory where the public key file belongs blocks the rename
    fs::create_directories(store.public_key_path() / "blocker");

    auto key = Ed25519IdentityKey::generate();
    REQUIRE(key.has_value());
    auto saved = store.save_identity(*key);
    REQUIRE_FALSE(saved.has_value());
    CHECK(saved.error().code() == Error::Code::IoError);

    CHECK_FALSE(fs::exists(store.secret_key_path()));
    CHECK_FALSE(has_temp_files(tmp.path));
}

TEST_CASE("KeyStore searches for an RSA key when none exists", "[crypto][keystore][rsa][unit]") {
    TempDir tmp;
    KeyStore store(tmp.path);
    FixedRsaKey fixed;

    auto result = store.load_or_find_rsa(fixed.fingerprint[0], {}, false, fixed.generator());
    REQUIRE(result.has_value());
    CHECK(result->generated);
    CHECK(result->attempts == 1);
    CHECK(result->fingerprint == fixed.fingerprint);
    CHECK(result->public_key_pem.starts_with("-----BEGIN RSA PUBLIC KEY-----"));

    REQUIRE(store.rsa_key_exists());
    auto perms = fs::status(store.rsa_key_path()).permissions();
    CHECK((perms & (fs::perms::group_all | fs::perms::others_all)) == fs::perms::none);
}

TEST_CASE("KeyStore reuses a matching RSA key", "[crypto][keystore][rsa][unit]") {
    TempDir tmp;
    KeyStore store(tmp.path);
    FixedRsaKey fixed;

    REQUIRE(store.load_or_find_rsa(fixed.fingerprint[0], {}, false, fixed.generator()).has_value());
    REQUIRE(fixed.calls == 1);

    auto again = store.load_or_find_rsa(fixed.fingerprint[0], {}, false, fixed.generator());
    REQUIRE(again.has_value());
    CHECK_FALSE(again->generated);
    CHECK(again->attempts == 0);
    CHECK(again->fingerprint == fixed.fingerprint);
    CHECK(fixed.calls == 1);

    SECTION("force searches anyway") {
        auto forced = store.load_or_find_rsa(fixed.fingerprint[0], {}, true, fixed.generator());
        REQUIRE(forced.has_value());
        CHECK(forced->generated);
        CHECK(fixed.calls == 2);
    }
}

TEST_CASE("KeyStore replaces an RSA key that no longer matches", "[crypto][keystore][rsa][unit]") {
    TempDir tmp;
    KeyStore store(tmp.path);
    FixedRsaKey old_key;
    FixedRsaKey new_key;

    REQUIRE(store.load_or_find_rsa(old_key.fingerprint[0], {}, false, old_key.generator())
                .has_value());

    auto result = store.load_or_find_rsa(new_key.fingerprint[0], {}, false, new_key.generator());
    if (old_key.fingerprint[0] == new_key.fingerprint[0]) {
        // The stored key already satisfies the new target
        REQUIRE(result.has_value());
        CHECK_FALSE(result->generated);
    } else {
        REQUIRE(result.has_value());
        CHECK(result->generated);
        CHECK(result->fingerprint == new_key.fingerprint);

        auto loaded = store.load_rsa();
        REQUIRE(loaded.has_value());
        CHECK(loaded->fingerprint == new_key.fingerprint);
    }
}

TEST_CASE("KeyStore reports an exhausted RSA search", "[crypto][keystore][rsa][unit]") {
    TempDir tmp;
    KeyStore store(tmp.path);
    FixedRsaKey fixed;

    uint8_t target = static_cast<uint8_t>(fixed.fingerprint[0] ^ 0x01);
    RsaMatchOptions options;
    options.max_attempts = 3;

    auto result = store.load_or_find_rsa(target, options, false, fixed.generator());
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == Error::Code::MatchNotFound);
    CHECK(fixed.calls == 3);
    CHECK_FALSE(store.rsa_key_exists());
}

TEST_CASE("KeyStore rejects a corrupt RSA key file", "[crypto][keystore][rsa][unit]") {
    TempDir tmp;
    KeyStore store(tmp.path);
    {
        std::ofstream file(store.rsa_key_path());
        file << "garbage\n";
    }

    auto result = store.load_or_find_rsa(0x00);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == Error::Code::CorruptKeyFile);
}

TEST_CASE("KeyStore does not reuse an RSA key of the wrong size", "[crypto][keystore][rsa][unit]") {
    TempDir tmp;
    KeyStore store(tmp.path);

    auto wide = RsaIdentityKey::generate(2048);
    REQUIRE(wide.has_value());
    auto wide_fp = wide->fingerprint();
    REQUIRE(wide_fp.has_value());
    REQUIRE(write_rsa_key(store.rsa_key_path(), *wide).has_value());

    // The daemon would refuse this key even though its prefix matches
    auto loaded = store.load_rsa();
    REQUIRE_FALSE(loaded.has_value());
    CHECK(loaded.error().code() == Error::Code::CorruptKeyFile);

    FixedRsaKey fixed;
    RsaMatchOptions options;
    options.max_attempts = 1;

    auto result = store.load_or_find_rsa((*wide_fp)[0], options, false, fixed.generator());
    CHECK(fixed.calls == 1);
    if (fixed.fingerprint[0] == (*wide_fp)[0]) {
        REQUIRE(result.has_value());
        CHECK(result->generated);
        CHECK(result->key.bits() == RSA_IDENTITY_BITS);
        CHECK(store.load_rsa().has_value());
    } else {
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == Error::Code::MatchNotFound);
        // The stored key is left for the operator to inspect
        CHECK(read_rsa_key(store.rsa_key_path()).value().bits() == 2048);
    }
}

TEST_CASE("Module errors map onto error codes", "[crypto][keystore][unit]") {
    fs::path path = "/keys/ed25519_master_id_secret_key";

    auto corrupt = to_error(KeyFileError::CorruptKeyFile, path);
    CHECK(corrupt.code() == Error::Code::CorruptKeyFile);
    CHECK(corrupt.message().find(path.string()) != std::string::npos);
    CHECK(to_error(KeyFileError::InvalidKeyLength, path).code() == Error::Code::InvalidKeyLength);
    CHECK(to_error(KeyFileError::KeyError, path).code() == Error::Code::CryptoError);
    CHECK(to_error(KeyFileError::PermissionError, path).code() == Error::Code::PermissionError);
    CHECK(to_error(KeyFileError::IoError, path).code() == Error::Code::IoError);

    CHECK(to_error(KeyError::InvalidKeyLength).code() == Error::Code::InvalidKeyLength);
    CHECK(to_error(KeyError::DerivationFailed).code() == Error::Code::CryptoError);

    CHECK(to_error(RsaError::MatchNotFound).code() == Error::Code::MatchNotFound);
    CHECK(to_error(RsaError::InvalidArgument).code() == Error::Code::InvalidArgument);
    CHECK(to_error(RsaError::ParseError).code() == Error::Code::CryptoError);

    // The location is the caller's
    auto here = to_error(RsaError::GenerationFailed);
    CHECK(std::string_view(here.file()).ends_with("test_key_store.cpp"));
}

TEST_CASE("KeyStore keeps the old secret when the public key file cannot be replaced",
          "[crypto][keystore][unit]") {
    TempDir tmp;
    KeyStore store(tmp.path);

    auto old_key = Ed25519IdentityKey::from_seed(fx::ZERO_SEED);
    REQUIRE(old_key.has_value());
    REQUIRE(write_secret_key(store.secret_key_path(), *old_key).has_value());
    fs::create_directories(store.public_key_path() / "blocker");

    auto new_key = Ed25519IdentityKey::from_seed(fx::COUNTING_SEED);
    REQUIRE(new_key.has_value());
    auto saved = store.save_identity(*new_key);
    REQUIRE_FALSE(saved.has_value());
    CHECK(saved.error().code() == Error::Code::IoError);

    // The new secret never lands beside the old public key
    auto secret = read_secret_key(store.secret_key_path());
    REQUIRE(secret.has_value());
    CHECK(std::equal(secret->begin(), secret->end(), old_key->expanded_secret().begin()));
    CHECK_FALSE(has_temp_files(tmp.path));
}

TEST_CASE("Forced regeneration replaces both key files", "[crypto][keystore][unit]") {
    TempDir tmp;
    KeyStore store(tmp.path);

    auto first = store.load_or_generate();
    REQUIRE(first.has_value());
    auto old_public = first->key.public_key();

    auto forced = store.load_or_generate(true);
    REQUIRE(forced.has_value());
    CHECK(forced->generated);
    CHECK(forced->key.public_key() != old_public);

    auto loaded = store.load_identity();
    REQUIRE(loaded.has_value());
    CHECK(loaded->consistent);
    CHECK(loaded->key.public_key() == forced->key.public_key());
    CHECK_FALSE(has_temp_files(tmp.path));
}
