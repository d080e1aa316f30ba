#include "VaultConfig.hpp"

#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace {
    spdlog::level::level_enum parseLevel(const std::string& name) {
        const auto level = spdlog::level::from_str(name);
        // from_str maps unknown names to off; only accept off when asked for it.
        if (level == spdlog::level::off && name != "off") {
            throw std::runtime_error("unknown log level '" + name + "'");
        }
        return level;
    }
}

namespace YAML {

template<>
struct convert<StorageConfig> {
    static Node encode(const StorageConfig& rhs) {
        Node node;
        node["vault_file"] = rhs.vault_file;
        node["database"] = rhs.database;
        return node;
    }

    static bool decode(const Node& node, StorageConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.vault_file = node["vault_file"].as<std::string>(rhs.vault_file);
        rhs.database = node["database"].as<std::string>(rhs.database);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        const auto sv = spdlog::level::to_string_view(rhs.level);
        node["level"] = std::string(sv.data(), sv.size());
        node["file"] = rhs.file;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["level"]) rhs.level = parseLevel(node["level"].as<std::string>());
        rhs.file = node["file"].as<std::string>(rhs.file);
        return true;
    }
};

}

std::string defaultVaultFile() {
    namespace fs = std::filesystem;
    const char* home = std::getenv("HOME");
    if (home && *home) return (fs::path(home) / ".promptpro" / "vault.ppv").string();
    return "vault.ppv";
}

VaultConfig defaultConfig() {
    VaultConfig cfg;
    cfg.storage.vault_file = defaultVaultFile();
    return cfg;
}

VaultConfig loadConfig(const std::string& path) {
    VaultConfig cfg = defaultConfig();
    try {
        YAML::Node root = YAML::LoadFile(path);
        if (auto node = root["storage"]) {
            if (!YAML::convert<StorageConfig>::decode(node, cfg.storage))
                throw std::runtime_error("'storage' must be a mapping");
        }
        if (auto node = root["logging"]) {
            if (!YAML::convert<LoggingConfig>::decode(node, cfg.logging))
                throw std::runtime_error("'logging' must be a mapping");
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("failed to load config '" + path + "': " + e.what());
    }
    return cfg;
}

VaultConfig loadConfigOrDefault(const std::string& path) {
    if (!std::filesystem::exists(path)) return defaultConfig();
    return loadConfig(path);
}
