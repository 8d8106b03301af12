#pragma once

#include <cstdint>
#include <expected>
#include <format>
#include <source_location>
#include <string>

namespace keynet::util {

// Error with context, reported by the key store and setup layer
class Error {
public:
    enum class Code {
        Unknown = 0,
        InvalidArgument,
        NotFound,

        // Key material
        InvalidKeyLength,
        CorruptKeyFile,
        MatchNotFound,

        // I/O errors
        IoError,
        PermissionError,

        // Crypto errors
        CryptoError,
    };

    Error() = default;

    Error(Code code, std::string message,
          std::source_location loc = std::source_location::current())
        : code_(code), message_(std::move(message)),
          file_(loc.file_name()), line_(loc.line()) {}

    [[nodiscard]] Code code() const { return code_; }
    [[nodiscard]] const std::string& message() const { return message_; }
    [[nodiscard]] const char* file() const { return file_; }
    [[nodiscard]] uint32_t line() const { return line_; }

    [[nodiscard]] std::string to_string() const;

    // Convenience constructors
    [[nodiscard]] static Error invalid_argument(
        std::string msg,
        std::source_location loc = std::source_location::current()) {
        return Error(Code::InvalidArgument, std::move(msg), loc);
    }

    [[nodiscard]] static Error invalid_key_length(
        std::string msg,
        std::source_location loc = std::source_location::current()) {
        return Error(Code::InvalidKeyLength, std::move(msg), loc);
    }

    [[nodiscard]] static Error corrupt_key_file(
        std::string msg,
        std::source_location loc = std::source_location::current()) {
        return Error(Code::CorruptKeyFile, std::move(msg), loc);
    }

    [[nodiscard]] static Error match_not_found(
        std::string msg,
        std::source_location loc = std::source_location::current()) {
        return Error(Code::MatchNotFound, std::move(msg), loc);
    }

    [[nodiscard]] static Error io_error(
        std::string msg,
        std::source_location loc = std::source_location::current()) {
        return Error(Code::IoError, std::move(msg), loc);
    }

    [[nodiscard]] static Error crypto_error(
        std::string msg,
        std::source_location loc = std::source_location::current()) {
        return Error(Code::CryptoError, std::move(msg), loc);
    }

private:
    Code code_{Code::Unknown};
    std::string message_;
    const char* file_{"unknown"};
    uint32_t line_{0};
};

template <typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

// Helper macros for error propagation (GNU statement expressions)
#define KEYNET_TRY(expr)                             \
    ({                                               \
        auto&& _result = (expr);                     \
        if (!_result) {                              \
            return std::unexpected(_result.error()); \
        }                                            \
        std::move(*_result);                         \
    })

#define KEYNET_TRY_VOID(expr)                        \
    do {                                             \
        auto&& _result = (expr);                     \
        if (!_result) {                              \
            return std::unexpected(_result.error()); \
        }                                            \
    } while (0)

[[nodiscard]] constexpr const char* error_code_name(Error::Code code) {
    switch (code) {
        case Error::Code::Unknown: return "Unknown";
        case Error::Code::InvalidArgument: return "InvalidArgument";
        case Error::Code::NotFound: return "NotFound";
        case Error::Code::InvalidKeyLength: return "InvalidKeyLength";
        case Error::Code::CorruptKeyFile: return "CorruptKeyFile";
        case Error::Code::MatchNotFound: return "MatchNotFound";
        case Error::Code::IoError: return "IoError";
        case Error::Code::PermissionError: return "PermissionError";
        case Error::Code::CryptoError: return "CryptoError";
        default: return "Unknown";
    }
}

inline std::string Error::to_string() const {
    return std::format("[{}] {}", error_code_name(code_), message_);
}

}  // namespace keynet::util
