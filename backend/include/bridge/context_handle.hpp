#pragma once

#include "stt/stt_interface.hpp"

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace soksak {
namespace bridge {

/**
 * Lazily constructs and caches the speech engine of one context.
 *
 * Concurrent first callers share a single construction and all observe its
 * outcome. A failed construction is not cached; the next call starts over.
 */
class EngineResolver {
public:
    explicit EngineResolver(stt::ModelSource source);

    std::shared_ptr<stt::SpeechEngine> resolve(stt::SpeechEngineFactory& factory);

    bool hasEngine() const;
    size_t getConstructionAttempts() const { return constructionAttempts_; }

private:
    using EngineFuture = std::shared_future<std::shared_ptr<stt::SpeechEngine>>;

    stt::ModelSource source_;
    mutable std::mutex mutex_;
    std::shared_ptr<stt::SpeechEngine> engine_;
    std::optional<EngineFuture> pending_;
    std::atomic<size_t> constructionAttempts_;
};

/**
 * State behind one soksak_context handle
 */
class Context {
public:
    Context(stt::ModelSource source, std::optional<std::string> fixedLanguage);

    /**
     * Build a context from C arguments. NULL and empty strings mean absent.
     */
    static std::shared_ptr<Context> create(const char* modelPath,
                                           const char* modelName,
                                           const char* language);

    const stt::ModelSource& getModelSource() const { return source_; }
    const std::optional<std::string>& getFixedLanguage() const { return fixedLanguage_; }

    std::shared_ptr<stt::SpeechEngine> resolveEngine(stt::SpeechEngineFactory& factory) {
        return resolver_.resolve(factory);
    }

    EngineResolver& getEngineResolver() { return resolver_; }

private:
    stt::ModelSource source_;
    std::optional<std::string> fixedLanguage_;
    EngineResolver resolver_;
};

} // namespace bridge
} // namespace soksak
