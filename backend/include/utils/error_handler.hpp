#pragma once

#include <string>
#include <exception>
#include <functional>
#include <chrono>
#include <map>
#include <mutex>
#include <vector>

namespace soksak {
namespace utils {

/**
 * Error severity levels
 */
enum class ErrorSeverity {
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

/**
 * Error categories for better classification
 */
enum class ErrorCategory {
    AUDIO_PROCESSING,
    STT,
    TRANSLATION,
    MODEL_LOADING,
    CONFIGURATION,
    SYSTEM,
    UNKNOWN
};

/**
 * Structured error information
 */
struct ErrorInfo {
    std::string id;
    ErrorCategory category;
    ErrorSeverity severity;
    std::string message;
    std::string details;
    std::string context;
    std::chrono::steady_clock::time_point timestamp;

    ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg,
              const std::string& det = "", const std::string& ctx = "");
};

/**
 * Root of the bridge exception hierarchy. what() is "message" or
 * "message: details" when details are present.
 */
class SoksakException : public std::exception {
public:
    explicit SoksakException(const ErrorInfo& error_info);
    const char* what() const noexcept override;
    const ErrorInfo& getErrorInfo() const { return error_info_; }

private:
    ErrorInfo error_info_;
    std::string what_message_;
};

class AudioProcessingException : public SoksakException {
public:
    AudioProcessingException(const std::string& message, const std::string& audio_path = "");
};

class STTException : public SoksakException {
public:
    STTException(const std::string& message, const std::string& context = "");
};

class TranslationException : public SoksakException {
public:
    TranslationException(const std::string& message, const std::string& context = "");

protected:
    explicit TranslationException(const ErrorInfo& error_info);
};

/**
 * Thrown when the local model for a translation direction is not installed.
 */
class LanguageResourceNotInstalledException : public TranslationException {
public:
    LanguageResourceNotInstalledException(const std::string& sourceLang,
                                          const std::string& targetLang,
                                          const std::string& searchedPath);

    const std::string& getSourceLang() const { return source_lang_; }
    const std::string& getTargetLang() const { return target_lang_; }

private:
    std::string source_lang_;
    std::string target_lang_;
};

class ModelLoadingException : public SoksakException {
public:
    ModelLoadingException(const std::string& message, const std::string& model_path = "");
};

class ConfigurationException : public SoksakException {
public:
    ConfigurationException(const std::string& message, const std::string& config_path = "");
};

/**
 * Error observer callback type
 */
using ErrorCallback = std::function<void(const ErrorInfo&)>;

/**
 * Central error sink: logs every reported error and keeps a bounded history.
 */
class ErrorHandler {
public:
    static ErrorHandler& getInstance();

    void reportError(const ErrorInfo& error);
    void reportError(const std::exception& e, const std::string& context = "");

    void setErrorCallback(ErrorCallback callback);

    // UNKNOWN counts every category
    size_t getErrorCount(ErrorCategory category = ErrorCategory::UNKNOWN) const;
    std::vector<ErrorInfo> getRecentErrors(size_t count = 10) const;
    void clearErrorHistory();

    void setMaxHistorySize(size_t max_size);

    static ErrorCategory categorize(const std::exception& e);
    static std::string categoryToString(ErrorCategory category);

private:
    ErrorHandler() = default;
    ~ErrorHandler() = default;
    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;

    void logError(const ErrorInfo& error) const;

    ErrorCallback error_callback_;
    std::vector<ErrorInfo> error_history_;
    size_t max_history_size_ = 256;

    mutable std::mutex mutex_;
};

} // namespace utils
} // namespace soksak
