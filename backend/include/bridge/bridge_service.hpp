#pragma once

#include "audio/audio_file_loader.hpp"
#include "core/task_queue.hpp"
#include "mt/language_detector.hpp"
#include "mt/translation_interface.hpp"
#include "stt/stt_interface.hpp"
#include "utils/config.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace soksak {
namespace bridge {

/**
 * The collaborators the adapters run against
 */
struct Backends {
    std::shared_ptr<stt::SpeechEngineFactory> engineFactory;
    std::shared_ptr<audio::AudioDecoder> audioDecoder;
    std::shared_ptr<mt::LanguageIdentifier> languageIdentifier;
    std::shared_ptr<mt::TranslationSessionFactory> translationFactory;

    /**
     * whisper.cpp, miniaudio, text language detection and Marian, wired
     * from the configuration.
     */
    static Backends createDefault(const utils::Config& config);
};

/**
 * Process-wide runtime behind the C interface: configuration, backends and
 * the worker pool that runs every request.
 */
class BridgeService {
public:
    static BridgeService& getInstance();

    /**
     * Apply a new configuration. Default backends are rebuilt from it on
     * next use and the worker pool is resized if needed.
     */
    void configure(const utils::Config& config);
    utils::Config getConfig() const;

    /**
     * Replace the backends used by subsequent requests. Incomplete sets are
     * filled in from the defaults.
     */
    void setBackends(Backends backends);
    void resetBackends();
    Backends getBackends();

    /**
     * Queue work on the bridge pool. Returns false when the bridge is
     * shutting down and the work was dropped.
     */
    bool schedule(std::function<void()> work, core::TaskPriority priority, const std::string& name);

    /**
     * Stop the pool after the queued work has run. A later schedule()
     * starts a new pool. From a bridge worker the stop is handed to a
     * reaper thread and this returns without waiting.
     */
    void drain();

    size_t getWorkerCount() const;

private:
    BridgeService();
    ~BridgeService();
    BridgeService(const BridgeService&) = delete;
    BridgeService& operator=(const BridgeService&) = delete;

    void ensurePoolLocked();
    void retirePool(std::unique_ptr<core::ThreadPool> pool);
    void joinReapers();

    mutable std::mutex mutex_;
    utils::Config config_;
    std::optional<Backends> backends_;
    std::shared_ptr<core::TaskQueue> taskQueue_;
    std::unique_ptr<core::ThreadPool> threadPool_;
    std::vector<std::thread> reapers_;
};

} // namespace bridge
} // namespace soksak
