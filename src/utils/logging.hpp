#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <optional>
#include <string>

namespace hoya::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

inline const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo: return "INFO";
        case LogLevel::kWarn: return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

inline std::optional<LogLevel> ParseLogLevel(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    if (value == "DEBUG") {
        return LogLevel::kDebug;
    }
    if (value == "INFO") {
        return LogLevel::kInfo;
    }
    if (value == "WARN" || value == "WARNING") {
        return LogLevel::kWarn;
    }
    if (value == "ERROR") {
        return LogLevel::kError;
    }
    return std::nullopt;
}

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

namespace detail {
inline std::atomic<LogLevel>& MinLevel() {
    static std::atomic<LogLevel> level{LogLevel::kInfo};
    return level;
}
}  // namespace detail

inline void ApplyLogConfig(const LogConfig& config) {
    detail::MinLevel().store(config.min_level);
}

inline bool ShouldLog(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(detail::MinLevel().load());
}

// Host diagnostics: one line per record, "[tag] message", on stderr.
inline void Log(LogLevel level, const std::string& tag, const std::string& message) {
    if (!ShouldLog(level)) {
        return;
    }
    if (level >= LogLevel::kWarn) {
        std::cerr << "[" << tag << "] " << ToString(level) << " " << message << std::endl;
        return;
    }
    std::cerr << "[" << tag << "] " << message << std::endl;
}

}  // namespace hoya::utils
