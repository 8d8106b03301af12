#include "keynet/util/config.hpp"
#include "keynet/util/logging.hpp"
#include <charconv>
#include <fstream>
#include <iostream>
#include <sstream>
#include <unordered_map>

namespace keynet::util {

// --- Minimal TOML parser (standard-library only) ---

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

// Drop a trailing "# comment" that is not inside a quoted string
std::string strip_comment(const std::string& s) {
    bool quoted = false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '"') {
            quoted = !quoted;
        } else if (s[i] == '#' && !quoted) {
            return s.substr(0, i);
        }
    }
    return s;
}

// Flat key-value store: "section.key" -> "value"
using TomlMap = std::unordered_map<std::string, std::string>;

std::expected<TomlMap, ConfigError> parse_toml_simple(const std::string& content) {
    TomlMap result;
    std::string current_section;
    std::istringstream stream(content);
    std::string line;

    while (std::getline(stream, line)) {
        line = trim(strip_comment(line));

        if (line.empty()) continue;

        // Section header: [section]
        if (line.front() == '[') {
            if (line.back() != ']') {
                return std::unexpected(ConfigError::ParseError);
            }
            current_section = trim(line.substr(1, line.size() - 2));
            continue;
        }

        // Key = value
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            return std::unexpected(ConfigError::ParseError);
        }

        auto key = trim(line.substr(0, eq));
        if (key.empty()) {
            return std::unexpected(ConfigError::ParseError);
        }
        auto value = unquote(trim(line.substr(eq + 1)));

        std::string fqkey = current_section.empty() ? key : current_section + "." + key;
        result[fqkey] = value;
    }

    return result;
}

const std::string* find(const TomlMap& m, const std::string& key) {
    auto it = m.find(key);
    return it != m.end() ? &it->second : nullptr;
}

template <typename Int>
std::expected<std::optional<Int>, ConfigError> get_int(const TomlMap& m, const std::string& key) {
    const auto* value = find(m, key);
    if (!value) return std::optional<Int>{};

    Int out{};
    auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), out);
    if (ec != std::errc{} || ptr != value->data() + value->size()) {
        return std::unexpected(ConfigError::InvalidValue);
    }
    return std::optional<Int>{out};
}

std::expected<std::optional<bool>, ConfigError> get_bool(const TomlMap& m, const std::string& key) {
    const auto* value = find(m, key);
    if (!value) return std::optional<bool>{};
    if (*value == "true") return std::optional<bool>{true};
    if (*value == "false") return std::optional<bool>{false};
    return std::unexpected(ConfigError::InvalidValue);
}

}  // namespace

// --- Config implementation ---

std::expected<Config, ConfigError> Config::load_from_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return std::unexpected(ConfigError::FileNotFound);
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(ConfigError::FileNotFound);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    return load_from_string(buffer.str());
}

std::expected<Config, ConfigError> Config::load_from_string(const std::string& toml_content) {
    Config config;

    auto parsed = parse_toml_simple(toml_content);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    const auto& m = *parsed;

    // [keys]
    if (const auto* dir = find(m, "keys.directory")) {
        config.keys.directory = *dir;
    }

    // [tls]
    if (const auto* pem = find(m, "tls.pem_path")) {
        config.tls.pem_path = *pem;
    }

    // [rsa]
    auto enabled = get_bool(m, "rsa.enabled");
    if (!enabled) return std::unexpected(enabled.error());
    if (*enabled) config.rsa.enabled = **enabled;

    auto attempts = get_int<uint32_t>(m, "rsa.max_attempts");
    if (!attempts) return std::unexpected(attempts.error());
    if (*attempts) config.rsa.max_attempts = **attempts;

    // [logging]
    if (const auto* level = find(m, "logging.level")) {
        config.logging.level = *level;
    }
    if (const auto* log_file = find(m, "logging.file")) {
        config.logging.log_file = *log_file;
    }
    auto console = get_bool(m, "logging.console");
    if (!console) return std::unexpected(console.error());
    if (*console) config.logging.log_to_console = **console;

    return config;
}

std::string Config::to_toml() const {
    std::ostringstream oss;
    oss << "[keys]\n";
    oss << "directory = \"" << keys.directory.string() << "\"\n\n";
    oss << "[tls]\n";
    oss << "pem_path = \"" << tls.pem_path.string() << "\"\n\n";
    oss << "[rsa]\n";
    oss << "enabled = " << (rsa.enabled ? "true" : "false") << "\n";
    oss << "max_attempts = " << rsa.max_attempts << "\n\n";
    oss << "[logging]\n";
    oss << "level = \"" << logging.level << "\"\n";
    if (!logging.log_file.empty()) {
        oss << "file = \"" << logging.log_file << "\"\n";
    }
    oss << "console = " << (logging.log_to_console ? "true" : "false") << "\n";
    return oss.str();
}

std::expected<void, ConfigError> Config::validate() const {
    if (keys.directory.empty() || tls.pem_path.empty()) {
        return std::unexpected(ConfigError::MissingRequired);
    }
    if (rsa.max_attempts == 0) {
        return std::unexpected(ConfigError::InvalidValue);
    }
    LogLevel level;
    if (!try_parse_log_level(logging.level, level)) {
        return std::unexpected(ConfigError::InvalidValue);
    }
    return {};
}

void Config::apply_cli_args(const CliArgs& args) {
    if (!args.positional.empty()) {
        keys.directory = args.positional[0];
    }
    if (args.positional.size() > 1) {
        tls.pem_path = args.positional[1];
    }
    if (args.log_level) {
        logging.level = *args.log_level;
    }
    if (args.log_file) {
        logging.log_file = *args.log_file;
    }
    if (args.max_attempts) {
        rsa.max_attempts = *args.max_attempts;
    }
    if (args.no_rsa) {
        rsa.enabled = false;
    }
}

Config default_config() {
    return Config{};
}

std::string example_config_toml() {
    return R"(
# keynet configuration

[keys]
directory = "/var/lib/tor/keys"

[tls]
pem_path = "/etc/keynet/ed25519-key.pem"

[rsa]
enabled = true
max_attempts = 10000

[logging]
level = "info"
)";
}

std::string config_error_message(ConfigError err) {
    switch (err) {
        case ConfigError::FileNotFound: return "Configuration file not found";
        case ConfigError::ParseError: return "Failed to parse configuration";
        case ConfigError::InvalidValue: return "Invalid configuration value";
        case ConfigError::MissingRequired: return "Missing required configuration";
        default: return "Unknown configuration error";
    }
}

std::optional<Command> parse_command(const std::string& name) {
    if (name == "setup") return Command::Setup;
    if (name == "export-pem") return Command::ExportPem;
    if (name == "check") return Command::Check;
    if (name == "fingerprint") return Command::Fingerprint;
    if (name == "address") return Command::Address;
    return std::nullopt;
}

const char* command_name(Command command) {
    switch (command) {
        case Command::Setup: return "setup";
        case Command::ExportPem: return "export-pem";
        case Command::Check: return "check";
        case Command::Fingerprint: return "fingerprint";
        case Command::Address: return "address";
    }
    return "unknown";
}

std::expected<CliArgs, std::string> parse_cli_args(int argc, char* argv[]) {
    CliArgs args;

    auto take_value = [&](int& i, const std::string& flag) -> std::expected<std::string, std::string> {
        if (i + 1 >= argc) {
            return std::unexpected("Missing value for " + flag);
        }
        return std::string(argv[++i]);
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
        } else if (arg == "--version" || arg == "-v") {
            args.version = true;
        } else if (arg == "--force") {
            args.force = true;
        } else if (arg == "--no-rsa") {
            args.no_rsa = true;
        } else if (arg == "--config" || arg == "-c") {
            auto value = take_value(i, arg);
            if (!value) return std::unexpected(value.error());
            args.config_file = *value;
        } else if (arg == "--log-level" || arg == "-l") {
            auto value = take_value(i, arg);
            if (!value) return std::unexpected(value.error());
            args.log_level = *value;
        } else if (arg == "--log-file") {
            auto value = take_value(i, arg);
            if (!value) return std::unexpected(value.error());
            args.log_file = *value;
        } else if (arg == "--max-attempts") {
            auto value = take_value(i, arg);
            if (!value) return std::unexpected(value.error());
            uint32_t attempts = 0;
            auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), attempts);
            if (ec != std::errc{} || ptr != value->data() + value->size() || attempts == 0) {
                return std::unexpected("Invalid value for --max-attempts: " + *value);
            }
            args.max_attempts = attempts;
        } else if (arg.size() > 1 && arg.front() == '-') {
            return std::unexpected("Unknown option: " + arg);
        } else if (!args.command) {
            args.command = parse_command(arg);
            if (!args.command) {
                return std::unexpected("Unknown command: " + arg);
            }
        } else {
            args.positional.push_back(arg);
        }
    }

    if (args.command) {
        size_t max_positional =
            (*args.command == Command::Setup || *args.command == Command::ExportPem) ? 2 : 1;
        if (args.positional.size() > max_positional) {
            return std::unexpected(std::string("Too many arguments for ") +
                                   command_name(*args.command));
        }
    }

    return args;
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " <command> [OPTIONS] [ARGS]\n"
              << "\n"
              << "Commands:\n"
              << "  setup [KEYS_DIR] [PEM_PATH]       Load or create the identity, print its address\n"
              << "  export-pem [KEYS_DIR] [PEM_PATH]  Write the Ed25519 key as PKCS#8 PEM\n"
              << "  check [KEYS_DIR]                  Verify the stored key pair\n"
              << "  fingerprint [KEYS_DIR]            Show Ed25519 and RSA fingerprints\n"
              << "  address [KEYS_DIR]                Print the address of the stored public key\n"
              << "\n"
              << "Options:\n"
              << "  -c, --config FILE       Configuration file (TOML)\n"
              << "  -l, --log-level LEVEL   trace, debug, info, warn, error, fatal\n"
              << "      --log-file FILE     Also append log output to FILE\n"
              << "      --force             Regenerate keys even if they exist\n"
              << "      --no-rsa            Skip the RSA identity key\n"
              << "      --max-attempts N    RSA search attempt limit\n"
              << "  -h, --help              Show this help\n"
              << "  -v, --version           Show version\n";
}

}  // namespace keynet::util
