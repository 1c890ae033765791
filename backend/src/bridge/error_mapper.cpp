#include "bridge/error_mapper.hpp"
#include "utils/error_handler.hpp"

namespace soksak {
namespace bridge {

const char* const kLanguageNotInstalledMessage =
    "Language model not installed. Please download it in System Settings > General > "
    "Language & Region > Translation Languages.";
const char* const kCouldNotDetectSourceLanguage = "Could not detect source language";
const char* const kUnknownErrorMessage = "Unknown error";

namespace {

void report(std::exception_ptr error, utils::ErrorCategory fallbackCategory, const std::string& context) {
    auto& handler = utils::ErrorHandler::getInstance();
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        utils::ErrorCategory category = utils::ErrorHandler::categorize(e);
        if (category == utils::ErrorCategory::UNKNOWN) {
            category = fallbackCategory;
        }
        handler.reportError(utils::ErrorInfo(category, utils::ErrorSeverity::ERROR, e.what(), "", context));
    } catch (...) {
        handler.reportError(utils::ErrorInfo(fallbackCategory, utils::ErrorSeverity::ERROR,
                                             kUnknownErrorMessage, "non-standard exception", context));
    }
}

} // namespace

std::string describeException(std::exception_ptr error) {
    if (!error) {
        return kUnknownErrorMessage;
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return kUnknownErrorMessage;
    }
}

std::string mapTranscriptionError(std::exception_ptr error) {
    if (error) {
        report(error, utils::ErrorCategory::STT, "transcribe");
    }
    return describeException(error);
}

std::string mapTranslationError(std::exception_ptr error) {
    if (!error) {
        return kUnknownErrorMessage;
    }
    report(error, utils::ErrorCategory::TRANSLATION, "translate");
    try {
        std::rethrow_exception(error);
    } catch (const utils::LanguageResourceNotInstalledException&) {
        return kLanguageNotInstalledMessage;
    } catch (...) {
        return describeException(std::current_exception());
    }
}

} // namespace bridge
} // namespace soksak
