#pragma once

#include <string>

namespace soksak {
namespace utils {

/**
 * Runtime configuration of the bridge. Every field has a usable default so a
 * process without a configuration file still works.
 */
class Config {
public:
    Config();

    /**
     * Load configuration from a JSON file. A missing file yields defaults;
     * a file that cannot be parsed throws ConfigurationException.
     */
    static Config load(const std::string& configPath);

    /**
     * Parse configuration from a JSON document, starting from defaults.
     */
    static Config fromJson(const std::string& jsonStr, const std::string& origin = "");

    /**
     * Defaults, overlaid with the file named by SOKSAK_BRIDGE_CONFIG and the
     * SOKSAK_LOG_LEVEL override.
     */
    static Config fromEnvironment();

    // Applies SOKSAK_LOG_LEVEL when set
    void applyEnvironmentOverrides();

    std::string getLogLevel() const { return logLevel_; }
    int getWorkerThreads() const { return workerThreads_; }
    size_t getEffectiveWorkerThreads() const;
    std::string getDefaultModelName() const { return defaultModelName_; }
    std::string getModelCacheDir() const { return modelCacheDir_; }
    std::string getModelBaseUrl() const { return modelBaseUrl_; }
    bool isDownloadAllowed() const { return allowDownload_; }
    std::string getVadModelPath() const { return vadModelPath_; }
    std::string getVadModelName() const { return vadModelName_; }
    std::string getVadModelBaseUrl() const { return vadModelBaseUrl_; }
    bool isGpuEnabled() const { return useGpu_; }
    bool isFlashAttentionEnabled() const { return flashAttention_; }
    std::string getTranslationModelsPath() const { return translationModelsPath_; }
    int getTranslationBeamSize() const { return translationBeamSize_; }

    void setLogLevel(const std::string& level) { logLevel_ = level; }
    void setWorkerThreads(int threads) { workerThreads_ = threads; }
    void setModelCacheDir(const std::string& dir) { modelCacheDir_ = dir; }
    void setAllowDownload(bool allow) { allowDownload_ = allow; }
    void setTranslationModelsPath(const std::string& path) { translationModelsPath_ = path; }

    static std::string defaultModelCacheDir();

private:
    std::string logLevel_ = "INFO";
    int workerThreads_ = 0;
    std::string defaultModelName_ = "base";
    std::string modelCacheDir_;
    std::string modelBaseUrl_ = "https://huggingface.co/ggerganov/whisper.cpp/resolve/main";
    bool allowDownload_ = true;
    std::string vadModelPath_;
    std::string vadModelName_ = "silero-v5.1.2";
    std::string vadModelBaseUrl_ = "https://huggingface.co/ggml-org/whisper-vad/resolve/main";
    bool useGpu_ = true;
    bool flashAttention_ = true;
    std::string translationModelsPath_ = "data/marian";
    int translationBeamSize_ = 5;
};

} // namespace utils
} // namespace soksak
