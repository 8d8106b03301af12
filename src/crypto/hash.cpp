#include "keynet/crypto/hash.hpp"
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <algorithm>
#include <stdexcept>

namespace keynet::crypto {

namespace {

const EVP_MD* evp_md(HashAlgorithm alg) {
    switch (alg) {
        case HashAlgorithm::Sha1: return EVP_sha1();
        case HashAlgorithm::Sha512: return EVP_sha512();
        case HashAlgorithm::Sha3_256: return EVP_sha3_256();
    }
    return nullptr;
}

constexpr char BASE32_ALPHABET[] = "abcdefghijklmnopqrstuvwxyz234567";

template <size_t N>
std::expected<std::array<uint8_t, N>, HashError>
one_shot(HashAlgorithm alg, std::span<const uint8_t> data) {
    Hasher hasher(alg);
    auto upd = hasher.update(data);
    if (!upd) {
        return std::unexpected(upd.error());
    }
    auto digest = hasher.finalize();
    if (!digest) {
        return std::unexpected(digest.error());
    }
    if (digest->size() != N) {
        return std::unexpected(HashError::InvalidLength);
    }
    std::array<uint8_t, N> out;
    std::copy(digest->begin(), digest->end(), out.begin());
    return out;
}

}  // namespace

void secure_zero(void* ptr, size_t len) {
    OPENSSL_cleanse(ptr, len);
}

std::vector<uint8_t> random_bytes(size_t len) {
    std::vector<uint8_t> result(len);
    if (RAND_bytes(result.data(), static_cast<int>(len)) != 1) {
        throw std::runtime_error("Failed to generate random bytes");
    }
    return result;
}

// Hasher implementation
struct Hasher::Impl {
    EVP_MD_CTX* ctx{nullptr};
    const EVP_MD* md{nullptr};

    explicit Impl(const EVP_MD* digest) : md(digest) {
        ctx = EVP_MD_CTX_new();
        if (ctx && md) {
            EVP_DigestInit_ex(ctx, md, nullptr);
        }
    }

    ~Impl() {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }
};

Hasher::Hasher(HashAlgorithm alg)
    : alg_(alg), impl_(std::make_unique<Impl>(evp_md(alg))) {}
Hasher::~Hasher() = default;
Hasher::Hasher(Hasher&&) noexcept = default;
Hasher& Hasher::operator=(Hasher&&) noexcept = default;

std::expected<void, HashError> Hasher::update(std::span<const uint8_t> data) {
    if (!impl_ || !impl_->ctx || !impl_->md) {
        return std::unexpected(HashError::OpenSSLError);
    }
    if (EVP_DigestUpdate(impl_->ctx, data.data(), data.size()) != 1) {
        return std::unexpected(HashError::UpdateFailed);
    }
    return {};
}

std::expected<void, HashError> Hasher::update(std::string_view data) {
    return update(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(data.data()), data.size()));
}

std::expected<std::vector<uint8_t>, HashError> Hasher::finalize() {
    if (!impl_ || !impl_->ctx || !impl_->md) {
        return std::unexpected(HashError::OpenSSLError);
    }

    std::vector<uint8_t> result(EVP_MAX_MD_SIZE);
    unsigned int len = 0;

    if (EVP_DigestFinal_ex(impl_->ctx, result.data(), &len) != 1) {
        return std::unexpected(HashError::FinalizeFailed);
    }
    result.resize(len);

    // Reset for reuse
    EVP_DigestInit_ex(impl_->ctx, impl_->md, nullptr);

    return result;
}

// Convenience functions
std::expected<std::array<uint8_t, SHA1_DIGEST_LEN>, HashError>
sha1(std::span<const uint8_t> data) {
    return one_shot<SHA1_DIGEST_LEN>(HashAlgorithm::Sha1, data);
}

std::expected<std::array<uint8_t, SHA512_DIGEST_LEN>, HashError>
sha512(std::span<const uint8_t> data) {
    return one_shot<SHA512_DIGEST_LEN>(HashAlgorithm::Sha512, data);
}

std::expected<std::array<uint8_t, SHA3_256_DIGEST_LEN>, HashError>
sha3_256(std::span<const uint8_t> data) {
    return one_shot<SHA3_256_DIGEST_LEN>(HashAlgorithm::Sha3_256, data);
}

// Hex encoding
std::string to_hex(std::span<const uint8_t> data) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(data.size() * 2);
    for (uint8_t byte : data) {
        result.push_back(hex_chars[byte >> 4]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

std::expected<std::vector<uint8_t>, HashError> from_hex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        return std::unexpected(HashError::InvalidLength);
    }

    std::vector<uint8_t> result;
    result.reserve(hex.size() / 2);

    for (size_t i = 0; i < hex.size(); i += 2) {
        uint8_t byte = 0;
        for (int j = 0; j < 2; ++j) {
            char c = hex[i + j];
            uint8_t nibble;
            if (c >= '0' && c <= '9') {
                nibble = c - '0';
            } else if (c >= 'a' && c <= 'f') {
                nibble = 10 + (c - 'a');
            } else if (c >= 'A' && c <= 'F') {
                nibble = 10 + (c - 'A');
            } else {
                return std::unexpected(HashError::InvalidEncoding);
            }
            byte = (byte << 4) | nibble;
        }
        result.push_back(byte);
    }

    return result;
}

// Base64 encoding
std::string to_base64(std::span<const uint8_t> data) {
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* mem = BIO_new(BIO_s_mem());
    b64 = BIO_push(b64, mem);
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);

    BIO_write(b64, data.data(), static_cast<int>(data.size()));
    (void)BIO_flush(b64);

    BUF_MEM* ptr;
    BIO_get_mem_ptr(b64, &ptr);

    std::string result(ptr->data, ptr->length);
    BIO_free_all(b64);

    return result;
}

std::expected<std::vector<uint8_t>, HashError> from_base64(const std::string& b64) {
    if (b64.empty()) {
        return std::vector<uint8_t>{};
    }

    BIO* bio = BIO_new_mem_buf(b64.data(), static_cast<int>(b64.size()));
    BIO* b64_bio = BIO_new(BIO_f_base64());
    bio = BIO_push(b64_bio, bio);
    BIO_set_flags(bio, BIO_FLAGS_BASE64_NO_NL);

    std::vector<uint8_t> result(b64.size());
    int len = BIO_read(bio, result.data(), static_cast<int>(result.size()));
    BIO_free_all(bio);

    if (len <= 0) {
        return std::unexpected(HashError::InvalidEncoding);
    }

    result.resize(len);
    return result;
}

// Base32 encoding, 5 bits per output character, most significant bits first
std::string to_base32(std::span<const uint8_t> data) {
    std::string result;
    result.reserve((data.size() * 8 + 4) / 5);

    uint32_t buffer = 0;
    int bits = 0;
    for (uint8_t byte : data) {
        buffer = (buffer << 8) | byte;
        bits += 8;
        while (bits >= 5) {
            result.push_back(BASE32_ALPHABET[(buffer >> (bits - 5)) & 0x1F]);
            bits -= 5;
        }
    }
    if (bits > 0) {
        result.push_back(BASE32_ALPHABET[(buffer << (5 - bits)) & 0x1F]);
    }
    return result;
}

std::expected<std::vector<uint8_t>, HashError> from_base32(std::string_view b32) {
    std::vector<uint8_t> result;
    result.reserve(b32.size() * 5 / 8);

    uint32_t buffer = 0;
    int bits = 0;
    for (char c : b32) {
        uint32_t value;
        if (c >= 'a' && c <= 'z') {
            value = static_cast<uint32_t>(c - 'a');
        } else if (c >= 'A' && c <= 'Z') {
            value = static_cast<uint32_t>(c - 'A');
        } else if (c >= '2' && c <= '7') {
            value = static_cast<uint32_t>(c - '2') + 26;
        } else {
            return std::unexpected(HashError::InvalidEncoding);
        }
        buffer = (buffer << 5) | value;
        bits += 5;
        if (bits >= 8) {
            result.push_back(static_cast<uint8_t>(buffer >> (bits - 8)));
            bits -= 8;
        }
    }

    // Leftover bits must be zero padding from the encoder
    if (bits >= 5 || (buffer & ((1u << bits) - 1)) != 0) {
        return std::unexpected(HashError::InvalidLength);
    }
    return result;
}

bool constant_time_compare(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b
) {
    if (a.size() != b.size()) {
        return false;
    }

    volatile uint8_t diff = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        diff |= a[i] ^ b[i];
    }
    return diff == 0;
}

}  // namespace keynet::crypto
