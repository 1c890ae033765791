#include "bridge/translation_adapter.hpp"
#include "bridge/error_mapper.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

#include <memory>
#include <optional>
#include <stdexcept>

namespace soksak {
namespace bridge {

namespace {

std::optional<std::string> optionalString(const char* value) {
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

void scheduleTranslation(std::shared_ptr<TranslationSink> sink,
                         std::function<void(TranslationSink&)> work) {
    bool scheduled = BridgeService::getInstance().schedule(
        [sink, work]() {
            try {
                work(*sink);
            } catch (...) {
                sink->fail(mapTranslationError(std::current_exception()));
            }
        },
        core::TaskPriority::HIGH, "translate");

    if (!scheduled) {
        sink->fail("Bridge is shutting down");
    }
}

} // namespace

void TranslationAdapter::start(const char* text,
                               const char* sourceLang,
                               const char* targetLang,
                               void* userData,
                               soksak_translate_result_callback resultCallback) {
    if (!resultCallback) {
        utils::Logger::warn("soksak_translate called without a result callback, ignoring");
        return;
    }

    auto sink = std::make_shared<TranslationSink>(resultCallback, userData);

    if (!text || !targetLang || *targetLang == '\0') {
        const char* problem = !text ? "Text to translate is missing" : "Target language is missing";
        scheduleTranslation(sink, [problem](TranslationSink&) {
            throw std::invalid_argument(problem);
        });
        return;
    }

    std::string input(text);
    std::string target(targetLang);
    std::optional<std::string> source = optionalString(sourceLang);

    if (!source) {
        Backends backends = BridgeService::getInstance().getBackends();
        try {
            source = backends.languageIdentifier->detectDominantLanguage(input);
        } catch (const std::exception& e) {
            utils::ErrorHandler::getInstance().reportError(e, "detectDominantLanguage");
            source.reset();
        }
        if (!source) {
            sink->fail(kCouldNotDetectSourceLanguage);
            return;
        }
        utils::Logger::debug("Detected source language: " + *source);
    }

    std::string resolvedSource = *source;
    scheduleTranslation(sink, [input, resolvedSource, target](TranslationSink& s) {
        run(input, resolvedSource, target, BridgeService::getInstance().getBackends(), s);
    });
}

void TranslationAdapter::run(const std::string& text,
                             const std::string& sourceLang,
                             const std::string& targetLang,
                             const Backends& backends,
                             TranslationSink& sink) {
    auto session = backends.translationFactory->createSession(sourceLang, targetLang);
    if (!session) {
        throw utils::TranslationException("No translation session for " + sourceLang + " -> " + targetLang,
                                          "TranslationAdapter");
    }
    session->prepare();
    std::string translated = session->translate(text);
    sink.succeed(translated);
}

} // namespace bridge
} // namespace soksak
