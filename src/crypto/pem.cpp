#include "keynet/crypto/pem.hpp"
#include "keynet/crypto/hash.hpp"
#include <algorithm>
#include <cctype>

namespace keynet::crypto {

namespace {

// Everything in the Ed25519 PrivateKeyInfo that precedes the 32 key bytes
constexpr std::array<uint8_t, 16> ED25519_PKCS8_PREFIX = {
    0x30, 0x2e,                    // SEQUENCE, 46 bytes
    0x02, 0x01, 0x00,              // INTEGER 0
    0x30, 0x05,                    // SEQUENCE, 5 bytes
    0x06, 0x03, 0x2b, 0x65, 0x70,  // OID 1.3.101.112
    0x04, 0x22,                    // OCTET STRING, 34 bytes
    0x04, 0x20,                    // OCTET STRING, 32 bytes
};

std::string boundary(std::string_view kind, std::string_view label) {
    std::string line = "-----";
    line.append(kind);
    line.push_back(' ');
    line.append(label);
    line.append("-----");
    return line;
}

}  // namespace

std::string pem_encode(std::string_view label, std::span<const uint8_t> der) {
    auto body = to_base64(der);

    std::string pem = boundary("BEGIN", label);
    pem.push_back('\n');
    for (size_t pos = 0; pos < body.size(); pos += PEM_LINE_WIDTH) {
        pem.append(body, pos, PEM_LINE_WIDTH);
        pem.push_back('\n');
    }
    pem.append(boundary("END", label));
    pem.push_back('\n');

    secure_zero(body.data(), body.size());
    return pem;
}

std::expected<std::vector<uint8_t>, PemError>
pem_decode(std::string_view label, std::string_view pem) {
    auto begin_line = boundary("BEGIN", label);
    auto end_line = boundary("END", label);

    auto begin = pem.find(begin_line);
    if (begin == std::string_view::npos) {
        return std::unexpected(PemError::MissingBoundary);
    }
    begin += begin_line.size();

    auto end = pem.find(end_line, begin);
    if (end == std::string_view::npos) {
        return std::unexpected(PemError::MissingBoundary);
    }

    std::string body;
    for (char c : pem.substr(begin, end - begin)) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            body.push_back(c);
        }
    }

    auto der = from_base64(body);
    secure_zero(body.data(), body.size());
    if (!der) {
        return std::unexpected(PemError::InvalidBase64);
    }
    return std::move(*der);
}

std::expected<std::array<uint8_t, ED25519_PKCS8_DER_LEN>, KeyError>
ed25519_pkcs8_der(std::span<const uint8_t> expanded_secret) {
    if (expanded_secret.size() != ED25519_EXPANDED_SECRET_LEN) {
        return std::unexpected(KeyError::InvalidKeyLength);
    }

    std::array<uint8_t, ED25519_PKCS8_DER_LEN> der;
    auto it = std::copy(ED25519_PKCS8_PREFIX.begin(), ED25519_PKCS8_PREFIX.end(), der.begin());
    std::copy(expanded_secret.begin(), expanded_secret.end(), it);
    return der;
}

std::expected<std::string, KeyError>
export_pkcs8_pem(std::span<const uint8_t> expanded_secret) {
    auto der = ed25519_pkcs8_der(expanded_secret);
    if (!der) {
        return std::unexpected(der.error());
    }

    auto pem = pem_encode(PEM_PRIVATE_KEY, *der);
    secure_zero(der->data(), der->size());
    return pem;
}

std::expected<void, KeyFileError>
write_pkcs8_pem(const std::filesystem::path& path, std::span<const uint8_t> expanded_secret) {
    auto pem = export_pkcs8_pem(expanded_secret);
    if (!pem) {
        return std::unexpected(KeyFileError::InvalidKeyLength);
    }

    auto result = write_key_file(
        path,
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(pem->data()), pem->size()),
        true);
    secure_zero(pem->data(), pem->size());
    return result;
}

std::string pem_error_message(PemError err) {
    switch (err) {
        case PemError::MissingBoundary: return "PEM boundary not found";
        case PemError::InvalidBase64: return "Invalid PEM body";
        default: return "Unknown PEM error";
    }
}

}  // namespace keynet::crypto
