#include "Logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <vector>

std::shared_ptr<spdlog::logger> Logger::makeConsoleLogger(spdlog::level::level_enum level) {
    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(level);
    auto logger = std::make_shared<spdlog::logger>("promptpro", consoleSink);
    logger->set_level(level);
    return logger;
}

void Logger::init(spdlog::level::level_enum level, const std::string& logFile) {
    std::vector<spdlog::sink_ptr> sinks;

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(level);
    sinks.push_back(consoleSink);

    if (!logFile.empty()) {
        namespace fs = std::filesystem;
        const fs::path parent = fs::path(logFile).parent_path();
        if (!parent.empty() && !fs::exists(parent)) {
            fs::create_directories(parent);
        }
        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, false);
        fileSink->set_level(level);
        sinks.push_back(fileSink);
    }

    auto logger = std::make_shared<spdlog::logger>("promptpro", begin(sinks), end(sinks));
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);

    std::lock_guard<std::mutex> lock(initMutex_);
    coreLogger_ = std::move(logger);
}

std::shared_ptr<spdlog::logger> Logger::core() {
    std::lock_guard<std::mutex> lock(initMutex_);
    if (!coreLogger_) coreLogger_ = makeConsoleLogger(spdlog::level::info);
    return coreLogger_;
}
