#include "keynet/crypto/keys.hpp"
#include "keynet/crypto/edwards25519.hpp"
#include "keynet/crypto/hash.hpp"
#include <openssl/bn.h>
#include <algorithm>
#include <stdexcept>

namespace keynet::crypto {

namespace {

// Group order l, big-endian hex
constexpr const char* GROUP_ORDER_HEX =
    "1000000000000000000000000000000014def9dea2f79cd65812631a5cf5d3ed";

}  // namespace

// Ed25519PublicKey implementation
Ed25519PublicKey::Ed25519PublicKey(std::array<uint8_t, SIZE> data)
    : data_(data) {}

Ed25519PublicKey::Ed25519PublicKey(std::span<const uint8_t> data) {
    if (data.size() != SIZE) {
        throw std::invalid_argument("Invalid Ed25519 public key length");
    }
    std::copy(data.begin(), data.end(), data_.begin());
}

std::string Ed25519PublicKey::to_hex() const {
    return crypto::to_hex(data_);
}

std::string Ed25519PublicKey::to_base64() const {
    auto encoded = crypto::to_base64(data_);
    while (!encoded.empty() && encoded.back() == '=') {
        encoded.pop_back();
    }
    return encoded;
}

std::expected<Ed25519PublicKey, KeyError>
Ed25519PublicKey::from_bytes(std::span<const uint8_t> data) {
    if (data.size() != SIZE) {
        return std::unexpected(KeyError::InvalidKeyLength);
    }
    return Ed25519PublicKey(data);
}

// Scalar helpers
void clamp_scalar(std::span<uint8_t, 32> scalar) {
    scalar[0] &= 248;
    scalar[31] &= 127;
    scalar[31] |= 64;
}

std::expected<std::array<uint8_t, ED25519_EXPANDED_SECRET_LEN>, KeyError>
expand_seed(std::span<const uint8_t> seed) {
    if (seed.size() != ED25519_SEED_LEN) {
        return std::unexpected(KeyError::InvalidKeyLength);
    }

    auto digest = sha512(seed);
    if (!digest) {
        return std::unexpected(KeyError::OpenSSLError);
    }

    std::array<uint8_t, ED25519_EXPANDED_SECRET_LEN> scalar;
    std::copy_n(digest->begin(), scalar.size(), scalar.begin());
    secure_zero(digest->data(), digest->size());

    clamp_scalar(scalar);
    return scalar;
}

std::expected<std::array<uint8_t, 32>, KeyError>
reduce_scalar(std::span<const uint8_t> scalar) {
    if (scalar.size() != 32) {
        return std::unexpected(KeyError::InvalidKeyLength);
    }

    BN_CTX* ctx = BN_CTX_secure_new();
    if (!ctx) {
        return std::unexpected(KeyError::OpenSSLError);
    }

    BIGNUM* order = nullptr;
    BIGNUM* value = BN_secure_new();
    BIGNUM* reduced = BN_secure_new();

    bool success = value && reduced &&
        BN_hex2bn(&order, GROUP_ORDER_HEX) != 0 &&
        BN_lebin2bn(scalar.data(), static_cast<int>(scalar.size()), value) != nullptr &&
        BN_nnmod(reduced, value, order, ctx) == 1;

    std::array<uint8_t, 32> out{};
    if (success) {
        success = BN_bn2lebinpad(reduced, out.data(), static_cast<int>(out.size())) == 32;
    }

    BN_clear_free(reduced);
    BN_clear_free(value);
    BN_free(order);
    BN_CTX_free(ctx);

    if (!success) {
        return std::unexpected(KeyError::DerivationFailed);
    }
    return out;
}

std::expected<Ed25519PublicKey, KeyError>
derive_public_key(std::span<const uint8_t> expanded_secret) {
    if (expanded_secret.size() != ED25519_EXPANDED_SECRET_LEN) {
        return std::unexpected(KeyError::InvalidKeyLength);
    }

    auto reduced = reduce_scalar(expanded_secret);
    if (!reduced) {
        return std::unexpected(reduced.error());
    }

    auto point = EdwardsPoint::scalar_mul_base(std::span<const uint8_t, 32>(*reduced));
    secure_zero(reduced->data(), reduced->size());

    return Ed25519PublicKey(point.compress());
}

std::expected<bool, KeyError> check_key_pair(
    std::span<const uint8_t> expanded_secret,
    std::span<const uint8_t> public_key
) {
    if (expanded_secret.size() != ED25519_EXPANDED_SECRET_LEN ||
        public_key.size() != ED25519_PUBLIC_KEY_LEN) {
        return std::unexpected(KeyError::InvalidKeyLength);
    }

    auto derived = derive_public_key(expanded_secret);
    if (!derived) {
        return std::unexpected(derived.error());
    }
    return constant_time_compare(derived->as_span(), public_key);
}

// Ed25519IdentityKey implementation
Ed25519IdentityKey::~Ed25519IdentityKey() {
    clear();
}

Ed25519IdentityKey::Ed25519IdentityKey(Ed25519IdentityKey&& other) noexcept
    : secret_(other.secret_)
    , public_key_(other.public_key_)
    , initialized_(other.initialized_) {
    other.clear();
}

Ed25519IdentityKey& Ed25519IdentityKey::operator=(Ed25519IdentityKey&& other) noexcept {
    if (this != &other) {
        clear();
        secret_ = other.secret_;
        public_key_ = other.public_key_;
        initialized_ = other.initialized_;
        other.clear();
    }
    return *this;
}

void Ed25519IdentityKey::clear() {
    secure_zero(secret_.data(), secret_.size());
    initialized_ = false;
}

std::expected<Ed25519IdentityKey, KeyError> Ed25519IdentityKey::generate() {
    std::vector<uint8_t> seed;
    try {
        seed = random_bytes(SEED_SIZE);
    } catch (const std::runtime_error&) {
        return std::unexpected(KeyError::GenerationFailed);
    }

    auto key = from_seed(seed);
    secure_zero(seed.data(), seed.size());
    return key;
}

std::expected<Ed25519IdentityKey, KeyError>
Ed25519IdentityKey::from_seed(std::span<const uint8_t> seed) {
    auto scalar = expand_seed(seed);
    if (!scalar) {
        return std::unexpected(scalar.error());
    }

    auto key = from_expanded_secret(*scalar);
    secure_zero(scalar->data(), scalar->size());
    return key;
}

std::expected<Ed25519IdentityKey, KeyError>
Ed25519IdentityKey::from_expanded_secret(std::span<const uint8_t> expanded_secret) {
    auto public_key = derive_public_key(expanded_secret);
    if (!public_key) {
        return std::unexpected(public_key.error());
    }
    return from_parts(expanded_secret, *public_key);
}

std::expected<Ed25519IdentityKey, KeyError>
Ed25519IdentityKey::from_parts(std::span<const uint8_t> expanded_secret,
                               const Ed25519PublicKey& public_key) {
    if (expanded_secret.size() != SECRET_SIZE) {
        return std::unexpected(KeyError::InvalidKeyLength);
    }

    Ed25519IdentityKey key;
    std::copy(expanded_secret.begin(), expanded_secret.end(), key.secret_.begin());
    key.public_key_ = public_key;
    key.initialized_ = true;
    return key;
}

bool Ed25519IdentityKey::is_consistent() const {
    if (!initialized_) {
        return false;
    }
    auto result = check_key_pair(secret_, public_key_.as_span());
    return result.has_value() && *result;
}

std::expected<std::array<uint8_t, ED25519_SECRET_TRAILER_LEN>, KeyError>
Ed25519IdentityKey::secret_trailer() const {
    if (!initialized_) {
        return std::unexpected(KeyError::InvalidKey);
    }

    auto digest = sha512(secret_);
    if (!digest) {
        return std::unexpected(KeyError::OpenSSLError);
    }

    std::array<uint8_t, ED25519_SECRET_TRAILER_LEN> trailer;
    std::copy(digest->begin() + SECRET_SIZE, digest->end(), trailer.begin());
    secure_zero(digest->data(), digest->size());
    return trailer;
}

std::string key_error_message(KeyError err) {
    switch (err) {
        case KeyError::GenerationFailed: return "Key generation failed";
        case KeyError::InvalidKeyLength: return "Invalid key length";
        case KeyError::InvalidKey: return "Invalid key";
        case KeyError::DerivationFailed: return "Key derivation failed";
        case KeyError::ParseError: return "Parse error";
        case KeyError::OpenSSLError: return "OpenSSL error";
        default: return "Unknown key error";
    }
}

}  // namespace keynet::crypto
