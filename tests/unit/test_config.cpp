#include <catch2/catch_all.hpp>
#include "keynet/util/config.hpp"
#include "fixtures/temp_dir.hpp"
#include <fstream>

using namespace keynet::util;
using keynet::test::TempDir;

namespace {

std::expected<CliArgs, std::string> parse(std::vector<std::string> args) {
    args.insert(args.begin(), "keynet");
    std::vector<char*> argv;
    for (auto& a : args) {
        argv.push_back(a.data());
    }
    return parse_cli_args(static_cast<int>(argv.size()), argv.data());
}

}  // namespace

TEST_CASE("Default configuration", "[util][config][unit]") {
    auto config = default_config();
    CHECK(config.keys.directory.string() == "/var/lib/tor/keys");
    CHECK(config.tls.pem_path.string() == "/etc/keynet/ed25519-key.pem");
    CHECK(config.rsa.enabled);
    CHECK(config.rsa.max_attempts == 10000);
    CHECK(config.logging.level == "info");
    CHECK(config.validate().has_value());
}

TEST_CASE("Configuration from TOML", "[util][config][unit]") {
    auto config = Config::load_from_string(R"(
# keynet
[keys]
directory = "/srv/tor/keys"   # shared with the daemon

[tls]
pem_path = "/srv/caddy/key.pem"

[rsa]
enabled = false
max_attempts = 500

[logging]
level = "debug"
file = "/var/log/keynet.log"
)");
    REQUIRE(config.has_value());
    CHECK(config->keys.directory.string() == "/srv/tor/keys");
    CHECK(config->tls.pem_path.string() == "/srv/caddy/key.pem");
    CHECK_FALSE(config->rsa.enabled);
    CHECK(config->rsa.max_attempts == 500);
    CHECK(config->logging.level == "debug");
    CHECK(config->logging.log_file == "/var/log/keynet.log");
    CHECK(config->validate().has_value());
}

TEST_CASE("Example configuration parses to the defaults", "[util][config][unit]") {
    auto config = Config::load_from_string(example_config_toml());
    REQUIRE(config.has_value());
    CHECK(config->keys.directory.string() == default_config().keys.directory.string());
    CHECK(config->rsa.max_attempts == 10000);
}

TEST_CASE("to_toml output loads back", "[util][config][unit]") {
    Config config;
    config.keys.directory = "/tmp/keys";
    config.rsa.max_attempts = 42;
    config.logging.log_file = "/tmp/keynet.log";

    auto loaded = Config::load_from_string(config.to_toml());
    REQUIRE(loaded.has_value());
    CHECK(loaded->keys.directory.string() == "/tmp/keys");
    CHECK(loaded->rsa.max_attempts == 42);
    CHECK(loaded->logging.log_file == "/tmp/keynet.log");
    CHECK(config.to_toml().find("bits") == std::string::npos);
}

TEST_CASE("Malformed configuration is rejected", "[util][config][unit]") {
    CHECK(Config::load_from_string("[keys\n").error() == ConfigError::ParseError);
    CHECK(Config::load_from_string("[keys]\ndirectory\n").error() == ConfigError::ParseError);
    CHECK(Config::load_from_string("[rsa]\nmax_attempts = many\n").error() ==
          ConfigError::InvalidValue);
    CHECK(Config::load_from_string("[rsa]\nenabled = yes\n").error() == ConfigError::InvalidValue);
    CHECK(Config::load_from_string("[rsa]\nmax_attempts = -1\n").error() ==
          ConfigError::InvalidValue);
}

TEST_CASE("Configuration validation", "[util][config][unit]") {
    Config config;

    SECTION("empty key directory") {
        config.keys.directory.clear();
        CHECK(config.validate().error() == ConfigError::MissingRequired);
    }
    SECTION("zero attempt ceiling") {
        config.rsa.max_attempts = 0;
        CHECK(config.validate().error() == ConfigError::InvalidValue);
    }
    SECTION("unknown log level") {
        config.logging.level = "loud";
        CHECK(config.validate().error() == ConfigError::InvalidValue);
    }
}

TEST_CASE("Configuration file loading", "[util][config][unit]") {
    TempDir tmp;
    auto path = tmp.path / "keynet.toml";
    {
        std::ofstream file(path);
        file << "[keys]\ndirectory = \"/data/keys\"\n";
    }

    auto config = Config::load_from_file(path);
    REQUIRE(config.has_value());
    CHECK(config->keys.directory.string() == "/data/keys");

    CHECK(Config::load_from_file(tmp.path / "absent.toml").error() == ConfigError::FileNotFound);
}

TEST_CASE("CLI commands and positionals", "[util][config][unit]") {
    auto args = parse({"setup", "/keys", "/out/key.pem", "--force"});
    REQUIRE(args.has_value());
    REQUIRE(args->command.has_value());
    CHECK(*args->command == Command::Setup);
    CHECK(args->force);
    REQUIRE(args->positional.size() == 2);

    Config config;
    config.apply_cli_args(*args);
    CHECK(config.keys.directory.string() == "/keys");
    CHECK(config.tls.pem_path.string() == "/out/key.pem");

    auto check = parse({"check", "/keys"});
    REQUIRE(check.has_value());
    CHECK(*check->command == Command::Check);

    CHECK(parse({"address", "/keys"})->command == Command::Address);
    CHECK(parse({"fingerprint"})->command == Command::Fingerprint);
    CHECK(parse({"export-pem", "/k", "/p"})->command == Command::ExportPem);
}

TEST_CASE("CLI options", "[util][config][unit]") {
    auto args = parse({"-c", "/etc/keynet.toml", "setup", "-l", "debug", "--log-file", "/tmp/k.log",
                       "--no-rsa", "--max-attempts", "250"});
    REQUIRE(args.has_value());
    REQUIRE(args->config_file.has_value());
    CHECK(args->config_file->string() == "/etc/keynet.toml");
    CHECK(args->log_level == "debug");
    CHECK(args->log_file == "/tmp/k.log");
    CHECK(args->no_rsa);
    CHECK(args->max_attempts == 250u);

    Config config;
    config.apply_cli_args(*args);
    CHECK_FALSE(config.rsa.enabled);
    CHECK(config.rsa.max_attempts == 250);
    CHECK(config.logging.level == "debug");
    CHECK(config.logging.log_file == "/tmp/k.log");
}

TEST_CASE("CLI errors", "[util][config][unit]") {
    CHECK_FALSE(parse({"rotate"}).has_value());
    CHECK_FALSE(parse({"setup", "--bogus"}).has_value());
    CHECK_FALSE(parse({"setup", "--max-attempts"}).has_value());
    CHECK_FALSE(parse({"setup", "--max-attempts", "0"}).has_value());
    CHECK_FALSE(parse({"setup", "--max-attempts", "ten"}).has_value());
    CHECK_FALSE(parse({"check", "/a", "/b"}).has_value());
    CHECK_FALSE(parse({"setup", "/a", "/b", "/c"}).has_value());

    auto help = parse({"--help"});
    REQUIRE(help.has_value());
    CHECK(help->help);
    CHECK_FALSE(help->command.has_value());
}
