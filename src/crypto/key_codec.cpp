#include "keynet/crypto/key_codec.hpp"
#include "keynet/crypto/hash.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace keynet::crypto {

namespace {

std::array<uint8_t, TOR_KEY_HEADER_LEN> make_header(std::string_view tag) {
    std::array<uint8_t, TOR_KEY_HEADER_LEN> header{};
    std::copy(tag.begin(), tag.end(), header.begin());
    return header;
}

bool header_matches(std::span<const uint8_t> contents, std::string_view tag) {
    auto expected = make_header(tag);
    return std::equal(expected.begin(), expected.end(), contents.begin());
}

}  // namespace

std::expected<std::array<uint8_t, TOR_SECRET_KEY_FILE_LEN>, KeyFileError>
encode_secret_key_file(const Ed25519IdentityKey& key) {
    if (!key.valid() || key.expanded_secret().size() != ED25519_EXPANDED_SECRET_LEN) {
        return std::unexpected(KeyFileError::InvalidKeyLength);
    }

    auto trailer = key.secret_trailer();
    if (!trailer) {
        return std::unexpected(KeyFileError::KeyError);
    }

    std::array<uint8_t, TOR_SECRET_KEY_FILE_LEN> out{};
    auto header = make_header(TOR_SECRET_KEY_TAG);
    auto it = std::copy(header.begin(), header.end(), out.begin());
    auto secret = key.expanded_secret();
    it = std::copy(secret.begin(), secret.end(), it);
    std::copy(trailer->begin(), trailer->end(), it);

    secure_zero(trailer->data(), trailer->size());
    return out;
}

std::array<uint8_t, TOR_PUBLIC_KEY_FILE_LEN>
encode_public_key_file(const Ed25519PublicKey& key) {
    std::array<uint8_t, TOR_PUBLIC_KEY_FILE_LEN> out{};
    auto header = make_header(TOR_PUBLIC_KEY_TAG);
    auto it = std::copy(header.begin(), header.end(), out.begin());
    std::copy(key.data().begin(), key.data().end(), it);
    return out;
}

std::expected<std::array<uint8_t, ED25519_EXPANDED_SECRET_LEN>, KeyFileError>
parse_secret_key_file(std::span<const uint8_t> contents) {
    if (contents.size() != TOR_SECRET_KEY_FILE_LEN ||
        !header_matches(contents, TOR_SECRET_KEY_TAG)) {
        return std::unexpected(KeyFileError::CorruptKeyFile);
    }

    std::array<uint8_t, ED25519_EXPANDED_SECRET_LEN> secret;
    std::copy_n(contents.begin() + TOR_KEY_HEADER_LEN, secret.size(), secret.begin());
    return secret;
}

std::expected<Ed25519PublicKey, KeyFileError>
parse_public_key_file(std::span<const uint8_t> contents) {
    if (contents.size() != TOR_PUBLIC_KEY_FILE_LEN ||
        !header_matches(contents, TOR_PUBLIC_KEY_TAG)) {
        return std::unexpected(KeyFileError::CorruptKeyFile);
    }
    return Ed25519PublicKey(contents.subspan(TOR_KEY_HEADER_LEN, ED25519_PUBLIC_KEY_LEN));
}

std::expected<void, KeyFileError>
write_key_file(const std::filesystem::path& path, std::span<const uint8_t> data, bool owner_only) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return std::unexpected(KeyFileError::IoError);
        }
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return std::unexpected(KeyFileError::IoError);
    }

    // Restrict before any key material lands in the file
    auto perms = owner_only
        ? std::filesystem::perms::owner_read | std::filesystem::perms::owner_write
        : std::filesystem::perms::owner_read | std::filesystem::perms::owner_write |
          std::filesystem::perms::group_read | std::filesystem::perms::others_read;
    std::filesystem::permissions(path, perms, std::filesystem::perm_options::replace, ec);
    if (ec) {
        return std::unexpected(KeyFileError::PermissionError);
    }

    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    file.flush();
    if (!file) {
        return std::unexpected(KeyFileError::IoError);
    }

    return {};
}

std::expected<std::vector<uint8_t>, KeyFileError>
read_key_file(const std::filesystem::path& path, size_t max_size) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::unexpected(KeyFileError::IoError);
    }
    if (size > max_size) {
        return std::unexpected(KeyFileError::CorruptKeyFile);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(KeyFileError::IoError);
    }

    std::vector<uint8_t> contents{std::istreambuf_iterator<char>(file),
                                  std::istreambuf_iterator<char>()};
    if (file.bad()) {
        return std::unexpected(KeyFileError::IoError);
    }
    return contents;
}

std::expected<void, KeyFileError>
write_secret_key(const std::filesystem::path& path, const Ed25519IdentityKey& key) {
    auto encoded = encode_secret_key_file(key);
    if (!encoded) {
        return std::unexpected(encoded.error());
    }

    auto result = write_key_file(path, *encoded, true);
    secure_zero(encoded->data(), encoded->size());
    return result;
}

std::expected<void, KeyFileError>
write_public_key(const std::filesystem::path& path, const Ed25519PublicKey& key) {
    return write_key_file(path, encode_public_key_file(key), false);
}

std::expected<std::array<uint8_t, ED25519_EXPANDED_SECRET_LEN>, KeyFileError>
read_secret_key(const std::filesystem::path& path) {
    auto contents = read_key_file(path, TOR_SECRET_KEY_FILE_LEN);
    if (!contents) {
        return std::unexpected(contents.error());
    }

    auto secret = parse_secret_key_file(*contents);
    secure_zero(contents->data(), contents->size());
    return secret;
}

std::expected<Ed25519PublicKey, KeyFileError>
read_public_key(const std::filesystem::path& path) {
    auto contents = read_key_file(path, TOR_PUBLIC_KEY_FILE_LEN);
    if (!contents) {
        return std::unexpected(contents.error());
    }
    return parse_public_key_file(*contents);
}

std::string key_file_error_message(KeyFileError err) {
    switch (err) {
        case KeyFileError::IoError: return "I/O error";
        case KeyFileError::CorruptKeyFile: return "Corrupt key file";
        case KeyFileError::PermissionError: return "Permission error";
        case KeyFileError::InvalidKeyLength: return "Invalid key length";
        case KeyFileError::KeyError: return "Key processing failed";
        default: return "Unknown key file error";
    }
}

}  // namespace keynet::crypto
