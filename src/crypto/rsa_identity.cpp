#include "keynet/crypto/rsa_identity.hpp"
#include "keynet/crypto/pem.hpp"
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>
#include <utility>

namespace keynet::crypto {

namespace {

EVP_PKEY* as_pkey(void* p) {
    return static_cast<EVP_PKEY*>(p);
}

}  // namespace

RsaIdentityKey::~RsaIdentityKey() {
    if (pkey_) {
        EVP_PKEY_free(as_pkey(pkey_));
    }
}

RsaIdentityKey::RsaIdentityKey(RsaIdentityKey&& other) noexcept
    : pkey_(std::exchange(other.pkey_, nullptr)) {}

RsaIdentityKey& RsaIdentityKey::operator=(RsaIdentityKey&& other) noexcept {
    if (this != &other) {
        if (pkey_) {
            EVP_PKEY_free(as_pkey(pkey_));
        }
        pkey_ = std::exchange(other.pkey_, nullptr);
    }
    return *this;
}

std::expected<RsaIdentityKey, RsaError> RsaIdentityKey::generate(int bits) {
    if (bits <= 0) {
        return std::unexpected(RsaError::InvalidArgument);
    }

    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_from_name(nullptr, "RSA", nullptr);
    if (!ctx) {
        return std::unexpected(RsaError::GenerationFailed);
    }

    EVP_PKEY* pkey = nullptr;
    if (EVP_PKEY_keygen_init(ctx) != 1 ||
        EVP_PKEY_CTX_set_rsa_keygen_bits(ctx, bits) != 1 ||
        EVP_PKEY_generate(ctx, &pkey) != 1) {
        EVP_PKEY_CTX_free(ctx);
        return std::unexpected(RsaError::GenerationFailed);
    }
    EVP_PKEY_CTX_free(ctx);

    return RsaIdentityKey(pkey);
}

std::expected<RsaIdentityKey, RsaError> RsaIdentityKey::from_pem(std::string_view pem) {
    BIO* bio = BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
    if (!bio) {
        return std::unexpected(RsaError::ParseError);
    }

    EVP_PKEY* pkey = PEM_read_bio_PrivateKey(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);

    if (!pkey) {
        return std::unexpected(RsaError::ParseError);
    }
    if (!EVP_PKEY_is_a(pkey, "RSA")) {
        EVP_PKEY_free(pkey);
        return std::unexpected(RsaError::ParseError);
    }

    return RsaIdentityKey(pkey);
}

int RsaIdentityKey::bits() const {
    return pkey_ ? EVP_PKEY_get_bits(as_pkey(pkey_)) : 0;
}

std::expected<std::string, RsaError> RsaIdentityKey::private_key_pem() const {
    if (!pkey_) {
        return std::unexpected(RsaError::EncodeFailed);
    }

    BIO* bio = BIO_new(BIO_s_mem());
    if (!bio) {
        return std::unexpected(RsaError::EncodeFailed);
    }

    if (PEM_write_bio_PrivateKey_traditional(
            bio, as_pkey(pkey_), nullptr, nullptr, 0, nullptr, nullptr) != 1) {
        BIO_free(bio);
        return std::unexpected(RsaError::EncodeFailed);
    }

    BUF_MEM* mem = nullptr;
    BIO_get_mem_ptr(bio, &mem);
    std::string pem(mem->data, mem->length);
    OPENSSL_cleanse(mem->data, mem->length);
    BIO_free(bio);

    return pem;
}

std::expected<std::vector<uint8_t>, RsaError> RsaIdentityKey::public_key_der() const {
    if (!pkey_) {
        return std::unexpected(RsaError::EncodeFailed);
    }

    int len = i2d_PublicKey(as_pkey(pkey_), nullptr);
    if (len <= 0) {
        return std::unexpected(RsaError::EncodeFailed);
    }

    std::vector<uint8_t> der(static_cast<size_t>(len));
    unsigned char* out = der.data();
    if (i2d_PublicKey(as_pkey(pkey_), &out) != len) {
        return std::unexpected(RsaError::EncodeFailed);
    }

    return der;
}

std::expected<std::string, RsaError> RsaIdentityKey::public_key_pem() const {
    auto der = public_key_der();
    if (!der) {
        return std::unexpected(der.error());
    }
    return pem_encode(PEM_RSA_PUBLIC_KEY, *der);
}

std::expected<RsaFingerprint, RsaError> RsaIdentityKey::fingerprint() const {
    auto der = public_key_der();
    if (!der) {
        return std::unexpected(der.error());
    }
    return compute_fingerprint(*der);
}

std::expected<RsaFingerprint, RsaError>
compute_fingerprint(std::span<const uint8_t> public_key_der) {
    auto digest = sha1(public_key_der);
    if (!digest) {
        return std::unexpected(RsaError::EncodeFailed);
    }
    return *digest;
}

std::string format_fingerprint(std::span<const uint8_t> fingerprint) {
    static constexpr char HEX[] = "0123456789ABCDEF";

    std::string out;
    out.reserve(fingerprint.size() * 2 + fingerprint.size() / 2);
    for (size_t i = 0; i < fingerprint.size(); ++i) {
        if (i > 0 && i % 2 == 0) {
            out.push_back(' ');
        }
        out.push_back(HEX[fingerprint[i] >> 4]);
        out.push_back(HEX[fingerprint[i] & 0x0F]);
    }
    return out;
}

std::expected<RsaMatch, RsaError> find_matching_key(
    uint8_t target_first_byte,
    const RsaMatchOptions& options,
    const RsaKeyGenerator& generator
) {
    if (options.max_attempts == 0) {
        return std::unexpected(RsaError::InvalidArgument);
    }

    for (uint32_t attempt = 1; attempt <= options.max_attempts; ++attempt) {
        auto key = generator ? generator(RSA_IDENTITY_BITS)
                             : RsaIdentityKey::generate(RSA_IDENTITY_BITS);
        if (!key) {
            return std::unexpected(key.error());
        }
        if (key->bits() != RSA_IDENTITY_BITS) {
            return std::unexpected(RsaError::GenerationFailed);
        }

        auto fp = key->fingerprint();
        if (!fp) {
            return std::unexpected(fp.error());
        }
        if ((*fp)[0] != target_first_byte) {
            continue;
        }

        auto private_pem = key->private_key_pem();
        if (!private_pem) {
            return std::unexpected(private_pem.error());
        }
        auto public_pem = key->public_key_pem();
        if (!public_pem) {
            return std::unexpected(public_pem.error());
        }

        RsaMatch match;
        match.key = std::move(*key);
        match.private_key_pem = std::move(*private_pem);
        match.public_key_pem = std::move(*public_pem);
        match.fingerprint = *fp;
        match.attempts = attempt;
        return match;
    }

    return std::unexpected(RsaError::MatchNotFound);
}

std::expected<void, KeyFileError>
write_rsa_key(const std::filesystem::path& path, const RsaIdentityKey& key) {
    auto pem = key.private_key_pem();
    if (!pem) {
        return std::unexpected(KeyFileError::KeyError);
    }

    auto result = write_key_file(
        path,
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(pem->data()), pem->size()),
        true);
    secure_zero(pem->data(), pem->size());
    return result;
}

std::expected<RsaIdentityKey, KeyFileError>
read_rsa_key(const std::filesystem::path& path) {
    auto contents = read_key_file(path, RSA_KEY_FILE_MAX_LEN);
    if (!contents) {
        return std::unexpected(contents.error());
    }

    auto key = RsaIdentityKey::from_pem(std::string_view(
        reinterpret_cast<const char*>(contents->data()), contents->size()));
    secure_zero(contents->data(), contents->size());
    if (!key) {
        return std::unexpected(KeyFileError::CorruptKeyFile);
    }
    return std::move(*key);
}

std::string rsa_error_message(RsaError err) {
    switch (err) {
        case RsaError::GenerationFailed: return "RSA key generation failed";
        case RsaError::EncodeFailed:     return "RSA key encoding failed";
        case RsaError::ParseError:       return "Failed to parse RSA key";
        case RsaError::MatchNotFound:    return "No RSA key with a matching fingerprint within the attempt limit";
        case RsaError::InvalidArgument:  return "Invalid RSA search parameters";
        default:                         return "Unknown RSA error";
    }
}

}  // namespace keynet::crypto
