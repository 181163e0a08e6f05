// Minimal console logger writing timestamped lines to stderr.
#pragma once

#include <string_view>

namespace Forge {

enum class LogLevel { Debug, Info, Warning, Error };

class Logger {
public:
    static void log(LogLevel level, std::string_view message);

    // Messages below this level are dropped (Info by default).
    static void setMinLevel(LogLevel level);
    static LogLevel minLevel();
};

inline void logDebug(std::string_view msg) { Logger::log(LogLevel::Debug, msg); }
inline void logInfo(std::string_view msg) { Logger::log(LogLevel::Info, msg); }
inline void logWarn(std::string_view msg) { Logger::log(LogLevel::Warning, msg); }
inline void logError(std::string_view msg) { Logger::log(LogLevel::Error, msg); }

}  // namespace Forge
