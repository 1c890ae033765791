#include "stt/whisper_stt.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

#include "whisper.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <memory>
#include <thread>

namespace soksak {
namespace stt {

namespace {

// Per-call state shared with the whisper.cpp callbacks
struct DecodeSession {
    SpeechEngine::SegmentCallback onSegment;
    std::exception_ptr callbackError;
    std::atomic<bool> abort{false};
};

void onNewSegments(whisper_context* /*ctx*/, whisper_state* state, int n_new, void* user_data) {
    auto* session = static_cast<DecodeSession*>(user_data);
    if (session->abort) {
        return;
    }

    const int n_segments = whisper_full_n_segments_from_state(state);
    for (int i = std::max(0, n_segments - n_new); i < n_segments; ++i) {
        const char* text = whisper_full_get_segment_text_from_state(state, i);
        // t0/t1 are in centiseconds
        const double start = static_cast<double>(whisper_full_get_segment_t0_from_state(state, i)) * 0.01;
        const double end = static_cast<double>(whisper_full_get_segment_t1_from_state(state, i)) * 0.01;

        try {
            session->onSegment(TranscriptionSegment(text ? text : "", start, end));
        } catch (...) {
            // Rethrown by transcribe() once whisper.cpp has unwound
            session->callbackError = std::current_exception();
            session->abort = true;
            return;
        }
    }
}

bool shouldAbort(void* user_data) {
    return static_cast<DecodeSession*>(user_data)->abort;
}

struct StateDeleter {
    void operator()(whisper_state* state) const { whisper_free_state(state); }
};

} // namespace

WhisperSTT::WhisperSTT(const std::string& modelPath,
                       const ComputeOptions& compute,
                       std::optional<std::string> vadModelPath)
    : ctx_(nullptr)
    , modelPath_(modelPath)
    , vadModelPath_(std::move(vadModelPath)) {

    utils::Logger::installNativeLogRouting();

    whisper_context_params ctx_params = whisper_context_default_params();
    ctx_params.use_gpu = compute.useGpu;
    ctx_params.flash_attn = compute.flashAttention;

    ctx_ = whisper_init_from_file_with_params(modelPath.c_str(), ctx_params);
    if (!ctx_) {
        throw utils::ModelLoadingException(
            "Failed to load whisper model. Check if the model file is valid and compatible", modelPath);
    }

    utils::Logger::info("Whisper model loaded: " + modelPath + " (" +
                        std::string(whisper_model_type_readable(ctx_)) + ", gpu=" +
                        (compute.useGpu ? "on" : "off") + ", vad=" +
                        (vadModelPath_ ? "on" : "off") + ")");
}

WhisperSTT::~WhisperSTT() {
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

int WhisperSTT::resolveThreadCount(int concurrentWorkerCount) {
    if (concurrentWorkerCount > 0) {
        return concurrentWorkerCount;
    }
    return std::max(1, static_cast<int>(std::thread::hardware_concurrency()));
}

std::string WhisperSTT::getModelDescription() const {
    return std::string("whisper.cpp ") + whisper_model_type_readable(ctx_) + " (" + modelPath_ + ")";
}

void WhisperSTT::transcribe(const std::vector<float>& samples,
                            const DecodeOptions& options,
                            SegmentCallback onSegment) {
    if (samples.empty()) {
        return;
    }

    std::unique_ptr<whisper_state, StateDeleter> state(whisper_init_state(ctx_));
    if (!state) {
        throw utils::STTException("Failed to allocate whisper decoding state", "WhisperSTT");
    }

    DecodeSession session;
    session.onSegment = std::move(onSegment);

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.n_threads = resolveThreadCount(options.concurrentWorkerCount);
    params.translate = false;
    params.print_realtime = false;
    params.print_progress = false;
    params.print_timestamps = false;
    params.print_special = !options.skipSpecialTokens;
    params.suppress_blank = options.suppressBlank;
    params.suppress_nst = options.skipSpecialTokens;
    params.temperature = options.temperature;
    params.temperature_inc = options.temperatureFallbackCount > 0 ? 0.2f : 0.0f;
    params.greedy.best_of = 1;

    params.language = options.language ? options.language->c_str() : "auto";
    params.detect_language = false;

    if (options.chunking == ChunkingStrategy::VAD) {
        if (vadModelPath_) {
            params.vad = true;
            params.vad_model_path = vadModelPath_->c_str();
            params.vad_params = whisper_vad_default_params();
            params.vad_params.min_speech_duration_ms = 150;
            params.vad_params.min_silence_duration_ms = 200;
            params.vad_params.speech_pad_ms = 30;
            params.no_context = true;
        } else {
            utils::Logger::debug("VAD requested but no VAD model is loaded, decoding without chunking");
        }
    }

    params.new_segment_callback = onNewSegments;
    params.new_segment_callback_user_data = &session;
    params.abort_callback = shouldAbort;
    params.abort_callback_user_data = &session;

    const int result = whisper_full_with_state(ctx_, state.get(), params,
                                               samples.data(), static_cast<int>(samples.size()));

    if (session.callbackError) {
        std::rethrow_exception(session.callbackError);
    }
    if (result != 0) {
        throw utils::STTException("Whisper transcription failed with code " + std::to_string(result),
                                  "WhisperSTT");
    }
}

// WhisperSTTFactory

WhisperSTTFactory::WhisperSTTFactory(const utils::Config& config, std::shared_ptr<ModelLocator> locator)
    : config_(config)
    , locator_(std::move(locator)) {
}

std::shared_ptr<SpeechEngine> WhisperSTTFactory::create(const ModelSource& source) {
    std::string modelPath = locator_->resolveModel(source);

    std::optional<std::string> vadModel = locator_->resolveVadModel();
    if (!vadModel) {
        utils::Logger::warn("Silero VAD model unavailable, transcription will run without VAD chunking");
    }

    WhisperSTT::ComputeOptions compute;
    compute.useGpu = config_.isGpuEnabled();
    compute.flashAttention = config_.isFlashAttentionEnabled();

    return std::make_shared<WhisperSTT>(modelPath, compute, std::move(vadModel));
}

} // namespace stt
} // namespace soksak
