#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace soksak {
namespace stt {

/**
 * One decoded span of speech. Times are seconds from the start of the audio.
 */
struct TranscriptionSegment {
    std::string text;
    double startSeconds;
    double endSeconds;

    TranscriptionSegment() : startSeconds(0.0), endSeconds(0.0) {}
    TranscriptionSegment(std::string t, double start, double end)
        : text(std::move(t)), startSeconds(start), endSeconds(end) {}
};

enum class ChunkingStrategy {
    NONE,
    VAD
};

/**
 * Per-call decoding parameters. Immutable once a call has started.
 */
struct DecodeOptions {
    std::optional<std::string> language;  // absent = auto-detect
    int concurrentWorkerCount = 0;         // 0 = every hardware thread
    ChunkingStrategy chunking = ChunkingStrategy::VAD;
    bool suppressBlank = true;
    bool skipSpecialTokens = true;
    float temperature = 0.0f;
    int temperatureFallbackCount = 0;

    /**
     * The fixed policy used for every bridge transcription. Only the
     * language can vary.
     */
    static DecodeOptions bridgeDefaults(const std::optional<std::string>& language);
};

/**
 * Where an engine's weights come from. modelPath wins when both are set.
 */
struct ModelSource {
    std::optional<std::string> modelPath;
    std::optional<std::string> modelName;

    std::string describe() const;
};

/**
 * A loaded speech recognition model. Implementations must tolerate
 * concurrent transcribe() calls.
 */
class SpeechEngine {
public:
    using SegmentCallback = std::function<void(const TranscriptionSegment& segment)>;

    virtual ~SpeechEngine() = default;

    /**
     * Decode 16 kHz mono samples, invoking onSegment for each segment in
     * the order produced. Throws STTException on decode failure; an
     * exception thrown by onSegment stops decoding and is rethrown.
     */
    virtual void transcribe(const std::vector<float>& samples,
                            const DecodeOptions& options,
                            SegmentCallback onSegment) = 0;

    virtual std::string getModelDescription() const = 0;
};

/**
 * Builds engines for a model source. Throws ModelLoadingException.
 */
class SpeechEngineFactory {
public:
    virtual ~SpeechEngineFactory() = default;
    virtual std::shared_ptr<SpeechEngine> create(const ModelSource& source) = 0;
};

} // namespace stt
} // namespace soksak
