#include "bridge/transcription_adapter.hpp"
#include "bridge/error_mapper.hpp"
#include "utils/logging.hpp"

#include <optional>
#include <stdexcept>

namespace soksak {
namespace bridge {

void TranscriptionAdapter::start(std::shared_ptr<Context> context,
                                 const char* audioPath,
                                 soksak_transcribe_result_callback resultCallback,
                                 soksak_transcribe_progress_callback progressCallback,
                                 void* userData) {
    if (!resultCallback) {
        utils::Logger::warn("soksak_transcribe called without a result callback, ignoring");
        return;
    }

    auto sink = std::make_shared<TranscriptionSink>(resultCallback, progressCallback, userData);
    std::optional<std::string> path;
    if (audioPath) {
        path = std::string(audioPath);
    }

    bool scheduled = BridgeService::getInstance().schedule(
        [context, path, sink]() {
            try {
                if (!context) {
                    throw std::invalid_argument("Invalid context handle");
                }
                if (!path || path->empty()) {
                    throw std::invalid_argument("Audio path is missing");
                }
                run(*context, *path, BridgeService::getInstance().getBackends(), *sink);
            } catch (...) {
                sink->fail(mapTranscriptionError(std::current_exception()));
            }
        },
        core::TaskPriority::NORMAL, "transcribe");

    if (!scheduled) {
        sink->fail("Bridge is shutting down");
    }
}

void TranscriptionAdapter::run(Context& context,
                               const std::string& audioPath,
                               const Backends& backends,
                               TranscriptionSink& sink) {
    audio::AudioBuffer audio = backends.audioDecoder->decodeFile(audioPath);
    if (audio.empty()) {
        utils::Logger::info("No audio samples in " + audioPath + ", nothing to transcribe");
        sink.succeed();
        return;
    }

    auto engine = context.resolveEngine(*backends.engineFactory);

    SegmentSequencer sequencer(audio.getDurationSeconds());
    stt::DecodeOptions options = stt::DecodeOptions::bridgeDefaults(context.getFixedLanguage());

    engine->transcribe(audio.samples, options, [&](const stt::TranscriptionSegment& segment) {
        auto accepted = sequencer.accept(segment);
        if (!accepted) {
            return;
        }
        sink.segment(*accepted);
        if (auto percent = sequencer.currentProgress()) {
            sink.progress(*percent);
        }
    });

    utils::Logger::debug("Transcribed " + audioPath + ": " + std::to_string(sequencer.getAcceptedCount()) +
                         " segments");
    sink.succeed();
}

} // namespace bridge
} // namespace soksak
