#include "bridge/bridge_service.hpp"
#include "mt/marian_translator.hpp"
#include "stt/model_locator.hpp"
#include "stt/whisper_stt.hpp"
#include "utils/http_download.hpp"
#include "utils/logging.hpp"

namespace soksak {
namespace bridge {

Backends Backends::createDefault(const utils::Config& config) {
    Backends backends;
    auto locator = std::make_shared<stt::ModelLocator>(config, std::make_shared<utils::HttpDownloader>());
    backends.engineFactory = std::make_shared<stt::WhisperSTTFactory>(config, locator);
    backends.audioDecoder = std::make_shared<audio::AudioFileLoader>();
    backends.languageIdentifier = std::make_shared<mt::LanguageDetector>();
    backends.translationFactory = std::make_shared<mt::MarianTranslatorFactory>(config);
    return backends;
}

BridgeService& BridgeService::getInstance() {
    static BridgeService instance;
    return instance;
}

BridgeService::BridgeService()
    : config_(utils::Config::fromEnvironment()) {
    utils::Logger::initialize();
    utils::Logger::setLevel(utils::Logger::parseLevel(config_.getLogLevel()));
}

BridgeService::~BridgeService() {
    std::unique_ptr<core::ThreadPool> pool;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (taskQueue_) {
            // Pending requests fail through their sinks instead of running at exit
            taskQueue_->clear();
        }
        pool = std::move(threadPool_);
        taskQueue_.reset();
    }
    retirePool(std::move(pool));
    joinReapers();
}

void BridgeService::configure(const utils::Config& config) {
    std::unique_ptr<core::ThreadPool> retired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        bool resize = threadPool_ &&
                      threadPool_->getNumThreads() != config.getEffectiveWorkerThreads();
        config_ = config;
        backends_.reset();
        if (resize) {
            retired = std::move(threadPool_);
            taskQueue_.reset();
        }
    }
    utils::Logger::setLevel(utils::Logger::parseLevel(config.getLogLevel()));

    // Work already queued on the old pool still runs to completion
    retirePool(std::move(retired));
    utils::Logger::info("Bridge configured: workers=" + std::to_string(config.getEffectiveWorkerThreads()) +
                        ", defaultModel=" + config.getDefaultModelName() +
                        ", translationModels=" + config.getTranslationModelsPath());
}

utils::Config BridgeService::getConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

void BridgeService::setBackends(Backends backends) {
    std::lock_guard<std::mutex> lock(mutex_);
    backends_ = std::move(backends);
}

void BridgeService::resetBackends() {
    std::lock_guard<std::mutex> lock(mutex_);
    backends_.reset();
}

Backends BridgeService::getBackends() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!backends_) {
        backends_ = Backends::createDefault(config_);
        return *backends_;
    }

    Backends& current = *backends_;
    if (!current.engineFactory || !current.audioDecoder ||
        !current.languageIdentifier || !current.translationFactory) {
        Backends defaults = Backends::createDefault(config_);
        if (!current.engineFactory) current.engineFactory = defaults.engineFactory;
        if (!current.audioDecoder) current.audioDecoder = defaults.audioDecoder;
        if (!current.languageIdentifier) current.languageIdentifier = defaults.languageIdentifier;
        if (!current.translationFactory) current.translationFactory = defaults.translationFactory;
    }
    return current;
}

void BridgeService::ensurePoolLocked() {
    if (threadPool_ && taskQueue_ && !taskQueue_->isShuttingDown()) {
        return;
    }
    taskQueue_ = std::make_shared<core::TaskQueue>();
    threadPool_ = std::make_unique<core::ThreadPool>(config_.getEffectiveWorkerThreads());
    threadPool_->start(taskQueue_);
}

bool BridgeService::schedule(std::function<void()> work, core::TaskPriority priority, const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensurePoolLocked();
    return taskQueue_->enqueue(std::move(work), priority, name);
}

void BridgeService::drain() {
    std::unique_ptr<core::ThreadPool> pool;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pool = std::move(threadPool_);
        taskQueue_.reset();
    }
    retirePool(std::move(pool));
    joinReapers();
}

void BridgeService::retirePool(std::unique_ptr<core::ThreadPool> pool) {
    if (!pool) {
        return;
    }
    if (!core::ThreadPool::isWorkerThread()) {
        pool->stop();
        return;
    }

    // A worker cannot join itself; the reaper waits for the calling task to return
    std::shared_ptr<core::ThreadPool> retired(std::move(pool));
    std::lock_guard<std::mutex> lock(mutex_);
    reapers_.emplace_back([retired]() {
        retired->stop();
    });
    utils::Logger::debug("Worker pool retired from a bridge worker");
}

void BridgeService::joinReapers() {
    std::vector<std::thread> reapers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reapers.swap(reapers_);
    }
    // A reaper may be joining the calling worker, so a worker only lets go of them
    bool onWorker = core::ThreadPool::isWorkerThread();
    for (auto& reaper : reapers) {
        if (!reaper.joinable()) {
            continue;
        }
        if (onWorker) {
            reaper.detach();
        } else {
            reaper.join();
        }
    }
}

size_t BridgeService::getWorkerCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return threadPool_ ? threadPool_->getNumThreads() : config_.getEffectiveWorkerThreads();
}

} // namespace bridge
} // namespace soksak
