#pragma once

#include <cstdio>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace parley {

/**
 * @brief Severity of a library log message
 *
 * Ordered so that a configured level filters out everything below it.
 * LogLevel::Off silences the logger entirely.
 */
enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

[[nodiscard]] inline const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Off: return "off";
    }
    return "unknown";
}

inline std::optional<LogLevel> log_level_from_string(std::string_view name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "off") return LogLevel::Off;
    return std::nullopt;
}

/// Receives every message that passes the configured level.
using LogCallback = std::function<void(LogLevel, std::string_view)>;

/**
 * @brief Level-filtered log sink
 *
 * Forwards messages to a user callback when one is installed, otherwise
 * writes them to stderr. Copies share nothing; each component holds its own
 * copy of the logger built from Config.
 *
 * @threadsafety Safe to call log() concurrently as long as the installed
 *               callback is.
 */
class Logger {
public:
    Logger() = default;

    explicit Logger(LogLevel level, std::optional<LogCallback> callback = std::nullopt)
        : level_(level)
        , callback_(std::move(callback))
    {}

    bool enabled(LogLevel level) const {
        return level_ != LogLevel::Off && level != LogLevel::Off && level >= level_;
    }

    void log(LogLevel level, std::string_view message) const {
        if (!enabled(level)) {
            return;
        }
        if (callback_ && *callback_) {
            (*callback_)(level, message);
            return;
        }
        fprintf(stderr, "[parley] %s: %.*s\n",
                log_level_to_string(level),
                static_cast<int>(message.size()),
                message.data());
    }

    void debug(std::string_view message) const { log(LogLevel::Debug, message); }
    void info(std::string_view message) const { log(LogLevel::Info, message); }
    void warn(std::string_view message) const { log(LogLevel::Warn, message); }
    void error(std::string_view message) const { log(LogLevel::Error, message); }

    LogLevel level() const { return level_; }

private:
    LogLevel level_ = LogLevel::Warn;
    std::optional<LogCallback> callback_;
};

} // namespace parley
