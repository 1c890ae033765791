#include "utils/logging.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>

#include "whisper.h"

namespace soksak {
namespace utils {

std::atomic<bool> Logger::initialized_{false};
std::atomic<int> Logger::level_{static_cast<int>(LogLevel::INFO)};

namespace {

std::mutex outputMutex;

// ggml emits partial lines (GGML_LOG_LEVEL_CONT); buffer until newline.
void whisperLogCallback(ggml_log_level level, const char* text, void* /*user_data*/) {
    static std::mutex bufferMutex;
    static std::string buffer;
    static ggml_log_level lastLevel = GGML_LOG_LEVEL_INFO;

    std::lock_guard<std::mutex> lock(bufferMutex);

    auto flush = [&]() {
        if (buffer.empty()) {
            return;
        }
        std::string line = "whisper: " + buffer;
        buffer.clear();
        switch (lastLevel) {
            case GGML_LOG_LEVEL_ERROR: Logger::error(line); break;
            case GGML_LOG_LEVEL_WARN: Logger::warn(line); break;
            default: Logger::debug(line); break;
        }
    };

    if (level != GGML_LOG_LEVEL_CONT) {
        flush();
        lastLevel = level;
    }

    if (text) {
        buffer += text;
    }

    if (!buffer.empty() && buffer.back() == '\n') {
        buffer.pop_back();
        flush();
    }
}

} // namespace

void Logger::initialize() {
    bool expected = false;
    if (initialized_.compare_exchange_strong(expected, true)) {
        installNativeLogRouting();
        debug("Logger initialized");
    }
}

void Logger::info(const std::string& message) {
    if (!isEnabled(LogLevel::INFO)) return;
    std::lock_guard<std::mutex> lock(outputMutex);
    std::cout << "[INFO] " << message << std::endl;
}

void Logger::warn(const std::string& message) {
    if (!isEnabled(LogLevel::WARN)) return;
    std::lock_guard<std::mutex> lock(outputMutex);
    std::cout << "[WARN] " << message << std::endl;
}

void Logger::error(const std::string& message) {
    if (!isEnabled(LogLevel::ERROR)) return;
    std::lock_guard<std::mutex> lock(outputMutex);
    std::cerr << "[ERROR] " << message << std::endl;
}

void Logger::debug(const std::string& message) {
    if (!isEnabled(LogLevel::DEBUG)) return;
    std::lock_guard<std::mutex> lock(outputMutex);
    std::cout << "[DEBUG] " << message << std::endl;
}

void Logger::setLevel(LogLevel level) {
    level_ = static_cast<int>(level);
}

LogLevel Logger::getLevel() {
    return static_cast<LogLevel>(level_.load());
}

bool Logger::isEnabled(LogLevel level) {
    return static_cast<int>(level) >= level_.load();
}

LogLevel Logger::parseLevel(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

void Logger::installNativeLogRouting() {
    whisper_log_set(whisperLogCallback, nullptr);
}

} // namespace utils
} // namespace soksak
