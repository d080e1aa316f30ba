#pragma once

#include <string>
#include <spdlog/spdlog.h>

struct StorageConfig {
    std::string vault_file;   // envelope file restored at startup / default dump target
    std::string database;     // optional SQLite live store; empty = in-memory only
};

struct LoggingConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    std::string file;         // empty = console only
};

struct VaultConfig {
    StorageConfig storage;
    LoggingConfig logging;
};

// $HOME/.promptpro/vault.ppv, or ./vault.ppv when HOME is unset.
std::string defaultVaultFile();

VaultConfig defaultConfig();

// Parses a YAML file; absent keys keep their defaults.
// Throws std::runtime_error if the file cannot be read or parsed.
VaultConfig loadConfig(const std::string& path);

// As loadConfig, but a missing file yields defaultConfig().
VaultConfig loadConfigOrDefault(const std::string& path);
