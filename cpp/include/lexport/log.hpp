#pragma once

#include <functional>
#include <string>

namespace lexport {

enum class LogLevel {
    Info,
    Ok,
    Error
};

using Logger = std::function<void(LogLevel, const std::string&)>;

inline void Log(const Logger& logger, LogLevel level, const std::string& message) {
    if (logger) {
        logger(level, message);
    }
}

inline void Log(const Logger& logger, const std::string& message) {
    Log(logger, LogLevel::Info, message);
}

}  // namespace lexport
