#pragma once

#include "core/core_export.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace lockbox::core {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

/**
 * @brief Process-wide diagnostics written to std::cerr
 *
 * Lines look like "2024-05-01T12:00:00.000Z [info] redemption: ...".
 * Raw invite tokens, token hashes and secrets must never be passed here.
 */
class LOCKBOX_CORE_EXPORT Log {
public:
    static void setLevel(LogLevel level);
    static LogLevel level();

    static std::optional<LogLevel> parseLevel(std::string_view name);

    static void write(LogLevel level, std::string_view component, std::string_view message);

    static void debug(std::string_view component, std::string_view message) {
        write(LogLevel::Debug, component, message);
    }
    static void info(std::string_view component, std::string_view message) {
        write(LogLevel::Info, component, message);
    }
    static void warning(std::string_view component, std::string_view message) {
        write(LogLevel::Warning, component, message);
    }
    static void error(std::string_view component, std::string_view message) {
        write(LogLevel::Error, component, message);
    }
};

} // namespace lockbox::core
