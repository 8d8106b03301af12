#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace keynet::util {

// Configuration error types
enum class ConfigError {
    FileNotFound,
    ParseError,
    InvalidValue,
    MissingRequired,
};

// Key directory shared with the relay daemon
struct KeysConfig {
    std::filesystem::path directory{"/var/lib/tor/keys"};
};

// TLS terminator key output
struct TlsConfig {
    std::filesystem::path pem_path{"/etc/keynet/ed25519-key.pem"};
};

// RSA identity search; the modulus is fixed at the daemon's 1024 bits
struct RsaConfig {
    bool enabled{true};
    uint32_t max_attempts{10000};
};

// Logging configuration
struct LoggingConfig {
    std::string level{"info"};
    std::string log_file;
    bool log_to_console{true};
};

struct CliArgs;

// Complete configuration
class Config {
public:
    Config() = default;

    // Load from TOML file
    [[nodiscard]] static std::expected<Config, ConfigError>
    load_from_file(const std::filesystem::path& path);

    // Load from TOML string
    [[nodiscard]] static std::expected<Config, ConfigError>
    load_from_string(const std::string& toml_content);

    // Serialize to TOML string
    [[nodiscard]] std::string to_toml() const;

    // Validate configuration
    [[nodiscard]] std::expected<void, ConfigError> validate() const;

    // Command-line values take precedence over the file
    void apply_cli_args(const CliArgs& args);

    // Configuration sections
    KeysConfig keys;
    TlsConfig tls;
    RsaConfig rsa;
    LoggingConfig logging;
};

// Generate default configuration
[[nodiscard]] Config default_config();

// Generate example configuration file content
[[nodiscard]] std::string example_config_toml();

// Utility
[[nodiscard]] std::string config_error_message(ConfigError err);

enum class Command {
    Setup,        // setup [keys-dir] [pem-path]
    ExportPem,    // export-pem [keys-dir] [pem-path]
    Check,        // check [keys-dir]
    Fingerprint,  // fingerprint [keys-dir]
    Address,      // address [keys-dir]
};

[[nodiscard]] std::optional<Command> parse_command(const std::string& name);
[[nodiscard]] const char* command_name(Command command);

// CLI argument parsing
struct CliArgs {
    std::optional<Command> command;
    std::vector<std::string> positional;
    std::optional<std::filesystem::path> config_file;
    std::optional<std::string> log_level;
    std::optional<std::string> log_file;
    std::optional<uint32_t> max_attempts;
    bool force{false};
    bool no_rsa{false};
    bool help{false};
    bool version{false};
};

[[nodiscard]] std::expected<CliArgs, std::string>
parse_cli_args(int argc, char* argv[]);

void print_usage(const char* program_name);

}  // namespace keynet::util
