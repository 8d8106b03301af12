#include "keynet/crypto/address.hpp"
#include "keynet/crypto/hash.hpp"
#include <algorithm>

namespace keynet::crypto {

std::expected<std::array<uint8_t, KEYNET_CHECKSUM_LEN>, AddressError>
address_checksum(std::span<const uint8_t> public_key, uint8_t version) {
    Hasher hasher(HashAlgorithm::Sha3_256);
    const uint8_t version_byte[1] = {version};

    if (!hasher.update(KEYNET_CHECKSUM_PREFIX) ||
        !hasher.update(public_key) ||
        !hasher.update(version_byte)) {
        return std::unexpected(AddressError::HashFailed);
    }

    auto digest = hasher.finalize();
    if (!digest || digest->size() < KEYNET_CHECKSUM_LEN) {
        return std::unexpected(AddressError::HashFailed);
    }

    return std::array<uint8_t, KEYNET_CHECKSUM_LEN>{(*digest)[0], (*digest)[1]};
}

std::expected<std::string, KeyError>
encode_address(std::span<const uint8_t> public_key) {
    if (public_key.size() != ED25519_PUBLIC_KEY_LEN) {
        return std::unexpected(KeyError::InvalidKeyLength);
    }

    auto checksum = address_checksum(public_key);
    if (!checksum) {
        return std::unexpected(KeyError::OpenSSLError);
    }

    std::array<uint8_t, KEYNET_ADDRESS_BYTES> address_bytes;
    auto it = std::copy(public_key.begin(), public_key.end(), address_bytes.begin());
    it = std::copy(checksum->begin(), checksum->end(), it);
    *it = KEYNET_ADDRESS_VERSION;

    return to_base32(address_bytes);
}

std::expected<std::string, KeyError>
encode_address(const Ed25519PublicKey& public_key) {
    return encode_address(public_key.as_span());
}

std::expected<Ed25519PublicKey, AddressError>
decode_address(std::string_view address) {
    if (address.ends_with(KEYNET_DOMAIN_SUFFIX)) {
        address.remove_suffix(KEYNET_DOMAIN_SUFFIX.size());
    }
    if (address.size() != KEYNET_ADDRESS_LEN) {
        return std::unexpected(AddressError::InvalidLength);
    }

    auto decoded = from_base32(address);
    if (!decoded) {
        return std::unexpected(AddressError::InvalidEncoding);
    }
    if (decoded->size() != KEYNET_ADDRESS_BYTES) {
        return std::unexpected(AddressError::InvalidLength);
    }

    uint8_t version = decoded->back();
    if (version != KEYNET_ADDRESS_VERSION) {
        return std::unexpected(AddressError::VersionMismatch);
    }

    std::span<const uint8_t> public_key(decoded->data(), ED25519_PUBLIC_KEY_LEN);
    auto checksum = address_checksum(public_key, version);
    if (!checksum) {
        return std::unexpected(checksum.error());
    }
    if (!std::equal(checksum->begin(), checksum->end(),
                    decoded->begin() + ED25519_PUBLIC_KEY_LEN)) {
        return std::unexpected(AddressError::ChecksumMismatch);
    }

    return Ed25519PublicKey(public_key);
}

std::string address_hostname(std::string_view address) {
    std::string host(address);
    host.append(KEYNET_DOMAIN_SUFFIX);
    return host;
}

std::string address_error_message(AddressError err) {
    switch (err) {
        case AddressError::InvalidLength: return "Invalid address length";
        case AddressError::InvalidEncoding: return "Invalid base32 encoding";
        case AddressError::VersionMismatch: return "Unsupported address version";
        case AddressError::ChecksumMismatch: return "Address checksum mismatch";
        case AddressError::HashFailed: return "Checksum hash failed";
        default: return "Unknown address error";
    }
}

}  // namespace keynet::crypto
