#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <sstream>
#include <iomanip>
#include <random>
#include <algorithm>

namespace soksak {
namespace utils {

// ErrorInfo implementation
ErrorInfo::ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg,
                     const std::string& det, const std::string& ctx)
    : category(cat), severity(sev), message(msg), details(det), context(ctx),
      timestamp(std::chrono::steady_clock::now()) {

    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    ss << "err_";
    for (int i = 0; i < 8; ++i) {
        ss << std::hex << dis(gen);
    }
    id = ss.str();
}

// SoksakException implementation
SoksakException::SoksakException(const ErrorInfo& error_info)
    : error_info_(error_info) {
    what_message_ = error_info_.message;
    if (!error_info_.details.empty()) {
        what_message_ += ": " + error_info_.details;
    }
}

const char* SoksakException::what() const noexcept {
    return what_message_.c_str();
}

AudioProcessingException::AudioProcessingException(const std::string& message, const std::string& audio_path)
    : SoksakException(ErrorInfo(ErrorCategory::AUDIO_PROCESSING, ErrorSeverity::ERROR,
                                message, audio_path, "AudioProcessing")) {
}

STTException::STTException(const std::string& message, const std::string& context)
    : SoksakException(ErrorInfo(ErrorCategory::STT, ErrorSeverity::ERROR,
                                message, "", context.empty() ? "STT" : context)) {
}

TranslationException::TranslationException(const std::string& message, const std::string& context)
    : SoksakException(ErrorInfo(ErrorCategory::TRANSLATION, ErrorSeverity::ERROR,
                                message, "", context.empty() ? "Translation" : context)) {
}

TranslationException::TranslationException(const ErrorInfo& error_info)
    : SoksakException(error_info) {
}

LanguageResourceNotInstalledException::LanguageResourceNotInstalledException(
    const std::string& sourceLang, const std::string& targetLang, const std::string& searchedPath)
    : TranslationException(ErrorInfo(ErrorCategory::TRANSLATION, ErrorSeverity::WARNING,
                                      "Translation model not installed for " + sourceLang + " -> " + targetLang,
                                      searchedPath, "Translation"))
    , source_lang_(sourceLang)
    , target_lang_(targetLang) {
}

ModelLoadingException::ModelLoadingException(const std::string& message, const std::string& model_path)
    : SoksakException(ErrorInfo(ErrorCategory::MODEL_LOADING, ErrorSeverity::CRITICAL,
                                message, model_path, "ModelLoading")) {
}

ConfigurationException::ConfigurationException(const std::string& message, const std::string& config_path)
    : SoksakException(ErrorInfo(ErrorCategory::CONFIGURATION, ErrorSeverity::ERROR,
                                message, config_path, "Configuration")) {
}

// ErrorHandler implementation
ErrorHandler& ErrorHandler::getInstance() {
    static ErrorHandler instance;
    return instance;
}

void ErrorHandler::reportError(const ErrorInfo& error) {
    ErrorCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        logError(error);

        error_history_.push_back(error);
        if (error_history_.size() > max_history_size_) {
            error_history_.erase(error_history_.begin());
        }
        callback = error_callback_;
    }

    if (callback) {
        try {
            callback(error);
        } catch (const std::exception& e) {
            Logger::error("Error in error callback: " + std::string(e.what()));
        }
    }
}

void ErrorHandler::reportError(const std::exception& e, const std::string& context) {
    ErrorCategory category = categorize(e);
    ErrorSeverity severity = ErrorSeverity::ERROR;

    if (auto bridgeError = dynamic_cast<const SoksakException*>(&e)) {
        severity = bridgeError->getErrorInfo().severity;
    }

    ErrorInfo error(category, severity, e.what(), "", context);
    reportError(error);
}

void ErrorHandler::setErrorCallback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_callback_ = std::move(callback);
}

size_t ErrorHandler::getErrorCount(ErrorCategory category) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (category == ErrorCategory::UNKNOWN) {
        return error_history_.size();
    }

    return std::count_if(error_history_.begin(), error_history_.end(),
                        [category](const ErrorInfo& error) {
                            return error.category == category;
                        });
}

std::vector<ErrorInfo> ErrorHandler::getRecentErrors(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (error_history_.size() <= count) {
        return error_history_;
    }

    return std::vector<ErrorInfo>(error_history_.end() - count, error_history_.end());
}

void ErrorHandler::clearErrorHistory() {
    std::lock_guard<std::mutex> lock(mutex_);
    error_history_.clear();
}

void ErrorHandler::setMaxHistorySize(size_t max_size) {
    std::lock_guard<std::mutex> lock(mutex_);
    max_history_size_ = std::max<size_t>(1, max_size);
    while (error_history_.size() > max_history_size_) {
        error_history_.erase(error_history_.begin());
    }
}

ErrorCategory ErrorHandler::categorize(const std::exception& e) {
    if (auto bridgeError = dynamic_cast<const SoksakException*>(&e)) {
        return bridgeError->getErrorInfo().category;
    }
    if (dynamic_cast<const std::bad_alloc*>(&e)) {
        return ErrorCategory::SYSTEM;
    }
    return ErrorCategory::UNKNOWN;
}

std::string ErrorHandler::categoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::AUDIO_PROCESSING: return "Audio";
        case ErrorCategory::STT: return "STT";
        case ErrorCategory::TRANSLATION: return "Translation";
        case ErrorCategory::MODEL_LOADING: return "ModelLoading";
        case ErrorCategory::CONFIGURATION: return "Configuration";
        case ErrorCategory::SYSTEM: return "System";
        case ErrorCategory::UNKNOWN: return "Unknown";
    }
    return "Unknown";
}

void ErrorHandler::logError(const ErrorInfo& error) const {
    std::stringstream log_message;
    log_message << "[" << error.id << "] " << categoryToString(error.category) << " - " << error.message;

    if (!error.details.empty()) {
        log_message << " | Details: " << error.details;
    }

    if (!error.context.empty()) {
        log_message << " | Context: " << error.context;
    }

    switch (error.severity) {
        case ErrorSeverity::INFO:
            Logger::info(log_message.str());
            break;
        case ErrorSeverity::WARNING:
            Logger::warn(log_message.str());
            break;
        case ErrorSeverity::ERROR:
        case ErrorSeverity::CRITICAL:
            Logger::error(log_message.str());
            break;
    }
}

} // namespace utils
} // namespace soksak
