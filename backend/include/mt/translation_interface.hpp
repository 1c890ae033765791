#pragma once

#include <memory>
#include <string>

namespace soksak {
namespace mt {

/**
 * One translation direction. Sessions are created per request and are not
 * shared between threads.
 */
class TranslationSession {
public:
    virtual ~TranslationSession() = default;

    /**
     * Make the language resources for this direction ready.
     * @throws LanguageResourceNotInstalledException if the model for the
     *         pair is not installed locally
     * @throws TranslationException if the resources exist but cannot be loaded
     */
    virtual void prepare() = 0;

    /**
     * Translate text. prepare() must have succeeded.
     * @throws TranslationException on failure
     */
    virtual std::string translate(const std::string& text) = 0;

    virtual std::string getSourceLang() const = 0;
    virtual std::string getTargetLang() const = 0;
};

/**
 * Creates translation sessions for (source, target) pairs. Creating a
 * session must be cheap; loading happens in prepare().
 */
class TranslationSessionFactory {
public:
    virtual ~TranslationSessionFactory() = default;

    virtual std::unique_ptr<TranslationSession> createSession(const std::string& sourceLang,
                                                              const std::string& targetLang) = 0;
};

/**
 * Language codes are path components of the model layout, so only
 * letters, digits, '-' and '_' are accepted.
 */
bool isValidLanguageCode(const std::string& code);

} // namespace mt
} // namespace soksak
