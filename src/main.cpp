#include <format>
#include <iostream>
#include <optional>
#include <string>

#include "keynet/core/setup.hpp"
#include "keynet/crypto/address.hpp"
#include "keynet/util/config.hpp"
#include "keynet/util/logging.hpp"

namespace {

using keynet::util::Command;

void print_version() {
    std::cout << "keynet v" << keynet::core::VersionInfo::to_string() << "\n"
              << "Built with C++23, OpenSSL 3.x\n";
}

std::optional<keynet::util::Config> create_config(const keynet::util::CliArgs& args) {
    keynet::util::Config config;

    if (args.config_file) {
        auto result = keynet::util::Config::load_from_file(*args.config_file);
        if (!result) {
            std::cerr << "Error: " << args.config_file->string() << ": "
                      << keynet::util::config_error_message(result.error()) << "\n";
            return std::nullopt;
        }
        config = std::move(*result);
    }

    config.apply_cli_args(args);

    auto valid = config.validate();
    if (!valid) {
        std::cerr << "Error: " << keynet::util::config_error_message(valid.error()) << "\n";
        return std::nullopt;
    }
    return config;
}

keynet::core::SetupOptions make_options(const keynet::util::Config& config, bool force) {
    keynet::core::SetupOptions options;
    options.keys_dir = config.keys.directory;
    options.pem_path = config.tls.pem_path;
    options.force = force;
    options.rsa_enabled = config.rsa.enabled;
    options.rsa.max_attempts = config.rsa.max_attempts;
    return options;
}

int run_setup(keynet::core::KeynetSetup& setup) {
    auto result = setup.run();
    if (!result) {
        LOG_ERROR("Setup failed: {}", result.error().to_string());
        return 1;
    }

    if (result->rsa_attempts > 0) {
        LOG_INFO("RSA search took {} attempts", result->rsa_attempts);
    }
    LOG_INFO("Keynet address: https://{}/", keynet::crypto::address_hostname(result->address));

    std::cout << result->address << std::endl;
    return 0;
}

int run_export_pem(keynet::core::KeynetSetup& setup) {
    auto result = setup.export_pem();
    if (!result) {
        LOG_ERROR("PEM export failed: {}", result.error().to_string());
        return 1;
    }
    return 0;
}

int run_check(keynet::core::KeynetSetup& setup) {
    auto result = setup.check();
    if (!result) {
        LOG_ERROR("Key check failed: {}", result.error().to_string());
        return 1;
    }
    return *result ? 0 : 1;
}

int run_address(keynet::core::KeynetSetup& setup) {
    auto result = setup.address();
    if (!result) {
        LOG_ERROR("Cannot compute address: {}", result.error().to_string());
        return 1;
    }
    std::cout << *result << std::endl;
    return 0;
}

int run_fingerprint(keynet::core::KeynetSetup& setup) {
    auto report = setup.fingerprint();
    if (!report) {
        LOG_ERROR("Cannot read fingerprints: {}", report.error().to_string());
        return 1;
    }

    std::cout << "Ed25519 public key:   " << report->public_key_hex << "\n"
              << "Ed25519 first byte:   " << std::format("{:02x}", report->ed25519_first_byte) << "\n"
              << "RSA fingerprint:      " << report->rsa_fingerprint_hex << "\n"
              << "RSA fingerprint (b64): " << report->rsa_fingerprint_base64 << "\n"
              << "RSA fingerprint (grp): " << report->rsa_fingerprint_grouped << "\n"
              << "First bytes match:    " << (report->prefix_matches ? "yes" : "no") << "\n";

    if (!report->prefix_matches) {
        LOG_WARN("RSA fingerprint does not start with the Ed25519 first byte");
        return 1;
    }
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args_result = keynet::util::parse_cli_args(argc, argv);
    if (!args_result) {
        std::cerr << "Error: " << args_result.error() << "\n";
        keynet::util::print_usage(argv[0]);
        return 1;
    }

    const auto& args = *args_result;

    if (args.help) {
        keynet::util::print_usage(argv[0]);
        return 0;
    }

    if (args.version) {
        print_version();
        return 0;
    }

    if (!args.command) {
        keynet::util::print_usage(argv[0]);
        return 1;
    }

    auto config = create_config(args);
    if (!config) {
        return 1;
    }

    // Logging goes to stderr; stdout carries only command output
    auto level = keynet::util::parse_log_level(config->logging.level);
    if (!keynet::util::configure_logging(level, config->logging.log_to_console,
                                         config->logging.log_file)) {
        std::cerr << "Error: cannot open log file " << config->logging.log_file << "\n";
        return 1;
    }

    LOG_DEBUG("Running {} on {}", keynet::util::command_name(*args.command),
              config->keys.directory.string());

    keynet::core::KeynetSetup setup(make_options(*config, args.force));

    switch (*args.command) {
        case Command::Setup: return run_setup(setup);
        case Command::ExportPem: return run_export_pem(setup);
        case Command::Check: return run_check(setup);
        case Command::Fingerprint: return run_fingerprint(setup);
        case Command::Address: return run_address(setup);
    }
    return 1;
}
