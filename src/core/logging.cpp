#include "core/logging.hpp"
#include "core/clock.hpp"
#include "core/encoding.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace lockbox::core {

namespace {

std::atomic<LogLevel> currentLevel{LogLevel::Info};
std::mutex outputMutex;

const char* levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "debug";
        case LogLevel::Info:    return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error:   return "error";
    }
    return "info";
}

} // namespace

void Log::setLevel(LogLevel level) {
    currentLevel.store(level);
}

LogLevel Log::level() {
    return currentLevel.load();
}

std::optional<LogLevel> Log::parseLevel(std::string_view name) {
    std::string lowered = toLowerAscii(name);
    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "info") return LogLevel::Info;
    if (lowered == "warning" || lowered == "warn") return LogLevel::Warning;
    if (lowered == "error") return LogLevel::Error;
    return std::nullopt;
}

void Log::write(LogLevel level, std::string_view component, std::string_view message) {
    if (static_cast<int>(level) < static_cast<int>(currentLevel.load())) {
        return;
    }

    std::string timestamp = formatIso8601(std::chrono::system_clock::now());

    std::lock_guard<std::mutex> lock(outputMutex);
    std::cerr << timestamp << " [" << levelName(level) << "] "
              << component << ": " << message << std::endl;
}

} // namespace lockbox::core
