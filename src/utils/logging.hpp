#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <string>

namespace pyrunner::utils {

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

inline LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return fallback;
}

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

inline std::atomic<LogLevel>& MinLogLevel() {
    static std::atomic<LogLevel> level{LogLevel::kInfo};
    return level;
}

inline void ApplyLogConfig(const LogConfig& config) {
    MinLogLevel().store(config.min_level);
}

inline bool ShouldLog(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(MinLogLevel().load());
}

// Writes "[tag] message", with the level spelled out for warnings and errors.
inline void Log(LogLevel level, const std::string& tag, const std::string& message) {
    if (!ShouldLog(level)) {
        return;
    }
    std::cerr << "[" << tag << "] ";
    if (level == LogLevel::kWarn || level == LogLevel::kError) {
        std::cerr << ToString(level) << " ";
    }
    std::cerr << message << std::endl;
}

}  // namespace pyrunner::utils
