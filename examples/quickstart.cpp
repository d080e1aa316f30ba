// examples/quickstart.cpp
#include "Logger.hpp"
#include "PromptManager.hpp"
#include "VaultConfig.hpp"
#include "VaultErrors.hpp"

#include <algorithm>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>

// ----- Small helpers -----

static std::string format_time(std::int64_t epochSeconds) {
    std::time_t t = static_cast<std::time_t>(epochSeconds);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(buf);
}

static void print_history(const PromptManager& vault, const std::string& key) {
    std::cout << "History for key: " << key << "\n";
    for (const auto& v : vault.history(key)) {
        std::string tags;
        for (const auto& t : v.tags) tags += (tags.empty() ? "" : ",") + t;
        std::cout << "  v" << std::left << std::setw(4) << v.number
                  << format_time(v.createdAt)
                  << "  [" << tags << "]"
                  << "  " << v.message.value_or("")
                  << "  sha256=" << v.contentHash.substr(0, 12) << "\n";
    }
}

int main(int argc, char** argv) {
    try {
        VaultConfig cfg = loadConfigOrDefault(argc > 1 ? argv[1] : "promptpro.yaml");
        Logger::init(cfg.logging.level, cfg.logging.file);

        auto vault = PromptManager::open(cfg);

        const std::string key = "greet";
        const auto keys = vault->keys();
        if (std::find(keys.begin(), keys.end(), key) == keys.end()) {
            vault->add(key, "hello world");
            vault->update(key, "hi there", std::string("friendlier"));
            vault->tag(key, "stable", 1);
        }

        std::cout << "latest : " << vault->get(key) << "\n";
        std::cout << "v1     : " << vault->get(key, "1") << "\n";
        std::cout << "stable : " << vault->get(key, "stable") << "\n";
        print_history(*vault, key);

        const std::string backup =
            (std::filesystem::temp_directory_path() / "promptpro-quickstart.ppv").string();
        vault->dump(backup, std::string("correct horse battery staple"));

        PromptManager copy;
        copy.restore(backup, std::string("correct horse battery staple"));
        std::cout << "restored " << copy.keys().size() << " prompt(s) from " << backup << "\n";

        if (!cfg.storage.vault_file.empty() && !vault->persistent()) {
            vault->dump(cfg.storage.vault_file);
        }
    } catch (const VaultError& e) {
        std::cerr << "Error [" << toString(e.code()) << "]: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
