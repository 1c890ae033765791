#pragma once

#include <exception>
#include <string>

namespace soksak {
namespace bridge {

extern const char* const kLanguageNotInstalledMessage;
extern const char* const kCouldNotDetectSourceLanguage;
extern const char* const kUnknownErrorMessage;

/**
 * what() of a std::exception, "Unknown error" for anything else.
 */
std::string describeException(std::exception_ptr error);

/**
 * Text reported to the host for a failed transcription. Reports the error
 * to utils::ErrorHandler.
 */
std::string mapTranscriptionError(std::exception_ptr error);

/**
 * Text reported to the host for a failed translation. A missing language
 * resource becomes the actionable install message; everything else passes
 * through unchanged.
 */
std::string mapTranslationError(std::exception_ptr error);

} // namespace bridge
} // namespace soksak
