#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <spdlog/spdlog.h>

// Process-wide spdlog facade. Usable before init(): core() then hands out a
// console logger at info level.
class Logger {
public:
    // logFile empty -> console only.
    static void init(spdlog::level::level_enum level = spdlog::level::info,
                     const std::string& logFile = "");

    static std::shared_ptr<spdlog::logger> core();

private:
    static std::shared_ptr<spdlog::logger> makeConsoleLogger(spdlog::level::level_enum level);

    inline static std::mutex initMutex_;
    inline static std::shared_ptr<spdlog::logger> coreLogger_;
};
