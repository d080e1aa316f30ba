// tests/config_load.cpp
#include <catch2/catch_all.hpp>
#include "VaultConfig.hpp"
#include "test_helpers.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

static std::string writeYaml(const TempPath& dir, const std::string& text) {
    fs::create_directories(dir.path());
    const std::string file = (dir.path() / "promptpro.yaml").string();
    std::ofstream out(file);
    out << text;
    return file;
}

TEST_CASE("Config: defaults", "[config]") {
    const VaultConfig cfg = defaultConfig();
    REQUIRE(cfg.storage.vault_file == defaultVaultFile());
    REQUIRE(cfg.storage.database.empty());
    REQUIRE(cfg.logging.level == spdlog::level::info);
    REQUIRE(cfg.logging.file.empty());

    REQUIRE(fs::path(defaultVaultFile()).filename() == "vault.ppv");
}

TEST_CASE("Config: a missing file falls back to defaults", "[config]") {
    TempPath dir("config_missing");
    const VaultConfig cfg = loadConfigOrDefault((dir.path() / "nope.yaml").string());
    REQUIRE(cfg.storage.vault_file == defaultVaultFile());
    REQUIRE_THROWS_AS(loadConfig((dir.path() / "nope.yaml").string()), std::runtime_error);
}

TEST_CASE("Config: values override defaults", "[config]") {
    TempPath dir("config_full");
    const std::string file = writeYaml(dir,
        "storage:\n"
        "  vault_file: /srv/prompts/vault.ppv\n"
        "  database: /srv/prompts/live.db\n"
        "logging:\n"
        "  level: debug\n"
        "  file: /var/log/promptpro.log\n");

    const VaultConfig cfg = loadConfig(file);
    REQUIRE(cfg.storage.vault_file == "/srv/prompts/vault.ppv");
    REQUIRE(cfg.storage.database == "/srv/prompts/live.db");
    REQUIRE(cfg.logging.level == spdlog::level::debug);
    REQUIRE(cfg.logging.file == "/var/log/promptpro.log");
}

TEST_CASE("Config: partial sections keep the remaining defaults", "[config]") {
    TempPath dir("config_partial");
    const std::string file = writeYaml(dir, "logging:\n  level: warn\n");

    const VaultConfig cfg = loadConfig(file);
    REQUIRE(cfg.logging.level == spdlog::level::warn);
    REQUIRE(cfg.storage.vault_file == defaultVaultFile());
    REQUIRE(cfg.storage.database.empty());
}

TEST_CASE("Config: malformed input is rejected", "[config]") {
    SECTION("unknown log level") {
        TempPath dir("config_level");
        REQUIRE_THROWS_AS(loadConfig(writeYaml(dir, "logging:\n  level: loud\n")), std::runtime_error);
    }
    SECTION("section that is not a mapping") {
        TempPath dir("config_scalar");
        REQUIRE_THROWS_AS(loadConfig(writeYaml(dir, "storage: just-a-string\n")), std::runtime_error);
    }
    SECTION("broken YAML") {
        TempPath dir("config_syntax");
        REQUIRE_THROWS_AS(loadConfig(writeYaml(dir, "storage: [unclosed\n")), std::runtime_error);
    }
    SECTION("explicit off is accepted") {
        TempPath dir("config_off");
        REQUIRE(loadConfig(writeYaml(dir, "logging:\n  level: off\n")).logging.level == spdlog::level::off);
    }
}
