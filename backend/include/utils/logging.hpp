#pragma once

#include <atomic>
#include <string>

namespace soksak {
namespace utils {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

class Logger {
public:
    static void initialize();
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);
    static void debug(const std::string& message);

    static void setLevel(LogLevel level);
    static LogLevel getLevel();
    static bool isEnabled(LogLevel level);

    /**
     * Parse a level name ("DEBUG", "INFO", "WARN"/"WARNING", "ERROR"),
     * case-insensitive. Unknown names yield INFO.
     */
    static LogLevel parseLevel(const std::string& name);
    static std::string levelToString(LogLevel level);

    /**
     * Route whisper.cpp / ggml log output through this logger.
     */
    static void installNativeLogRouting();

private:
    static std::atomic<bool> initialized_;
    static std::atomic<int> level_;
};

} // namespace utils
} // namespace soksak
