#include "bridge/context_handle.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

namespace soksak {
namespace bridge {

namespace {

std::optional<std::string> optionalString(const char* value) {
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

} // namespace

EngineResolver::EngineResolver(stt::ModelSource source)
    : source_(std::move(source))
    , constructionAttempts_(0) {
}

bool EngineResolver::hasEngine() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return engine_ != nullptr;
}

std::shared_ptr<stt::SpeechEngine> EngineResolver::resolve(stt::SpeechEngineFactory& factory) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (engine_) {
        return engine_;
    }
    if (pending_) {
        EngineFuture inFlight = *pending_;
        lock.unlock();
        return inFlight.get();
    }

    std::promise<std::shared_ptr<stt::SpeechEngine>> promise;
    pending_ = promise.get_future().share();
    lock.unlock();

    constructionAttempts_++;
    utils::Logger::info("Loading speech engine (" + source_.describe() + ")");

    std::shared_ptr<stt::SpeechEngine> engine;
    try {
        engine = factory.create(source_);
        if (!engine) {
            throw utils::ModelLoadingException("Speech engine factory returned no engine", source_.describe());
        }
    } catch (...) {
        lock.lock();
        pending_.reset();
        lock.unlock();
        promise.set_exception(std::current_exception());
        throw;
    }

    lock.lock();
    engine_ = engine;
    pending_.reset();
    lock.unlock();

    promise.set_value(engine);
    return engine;
}

Context::Context(stt::ModelSource source, std::optional<std::string> fixedLanguage)
    : source_(source)
    , fixedLanguage_(std::move(fixedLanguage))
    , resolver_(std::move(source)) {
}

std::shared_ptr<Context> Context::create(const char* modelPath, const char* modelName, const char* language) {
    stt::ModelSource source;
    source.modelPath = optionalString(modelPath);
    source.modelName = optionalString(modelName);
    return std::make_shared<Context>(std::move(source), optionalString(language));
}

} // namespace bridge
} // namespace soksak
