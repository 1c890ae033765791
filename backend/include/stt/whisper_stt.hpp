#pragma once

#include "stt/model_locator.hpp"
#include "stt/stt_interface.hpp"
#include "utils/config.hpp"

#include <memory>
#include <optional>
#include <string>

struct whisper_context;

namespace soksak {
namespace stt {

/**
 * whisper.cpp speech engine. The loaded context is shared; every
 * transcribe() call decodes with its own whisper_state.
 */
class WhisperSTT : public SpeechEngine {
public:
    struct ComputeOptions {
        bool useGpu = true;
        bool flashAttention = true;
    };

    /**
     * Load the model at modelPath. vadModelPath enables VAD chunking; when
     * absent, calls asking for VAD decode the whole input instead.
     * Throws ModelLoadingException.
     */
    WhisperSTT(const std::string& modelPath,
               const ComputeOptions& compute,
               std::optional<std::string> vadModelPath);
    ~WhisperSTT() override;

    WhisperSTT(const WhisperSTT&) = delete;
    WhisperSTT& operator=(const WhisperSTT&) = delete;

    void transcribe(const std::vector<float>& samples,
                    const DecodeOptions& options,
                    SegmentCallback onSegment) override;

    std::string getModelDescription() const override;

    bool hasVadModel() const { return vadModelPath_.has_value(); }

    static int resolveThreadCount(int concurrentWorkerCount);

private:
    whisper_context* ctx_;
    std::string modelPath_;
    std::optional<std::string> vadModelPath_;
};

/**
 * Builds WhisperSTT engines from model sources using the runtime
 * configuration for compute and VAD settings.
 */
class WhisperSTTFactory : public SpeechEngineFactory {
public:
    WhisperSTTFactory(const utils::Config& config, std::shared_ptr<ModelLocator> locator);

    std::shared_ptr<SpeechEngine> create(const ModelSource& source) override;

private:
    utils::Config config_;
    std::shared_ptr<ModelLocator> locator_;
};

} // namespace stt
} // namespace soksak
