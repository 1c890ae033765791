#include "bridge/callback_dispatch.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <cctype>

namespace soksak {
namespace bridge {

const char* const kTranscriptionEndedWithoutResult = "Transcription ended without a result";
const char* const kTranslationEndedWithoutResult = "Translation ended without a result";

namespace {

std::string trim(const std::string& text) {
    auto notSpace = [](char c) { return !std::isspace(static_cast<unsigned char>(c)); };
    auto begin = std::find_if(text.begin(), text.end(), notSpace);
    auto end = std::find_if(text.rbegin(), text.rend(), notSpace).base();
    return begin < end ? std::string(begin, end) : std::string();
}

} // namespace

// TranscriptionSink

TranscriptionSink::TranscriptionSink(soksak_transcribe_result_callback resultCallback,
                                     soksak_transcribe_progress_callback progressCallback,
                                     void* userData)
    : resultCallback_(resultCallback)
    , progressCallback_(progressCallback)
    , userData_(userData)
    , finished_(false) {
}

TranscriptionSink::~TranscriptionSink() {
    if (!finished_) {
        utils::Logger::warn("Transcription request dropped without a terminal callback");
        fail(kTranscriptionEndedWithoutResult);
    }
}

void TranscriptionSink::segment(const stt::TranscriptionSegment& segment) {
    if (finished_ || !resultCallback_) {
        return;
    }
    resultCallback_(segment.text.c_str(), nullptr, segment.startSeconds, segment.endSeconds, userData_);
}

void TranscriptionSink::progress(double percent) {
    if (finished_ || !progressCallback_) {
        return;
    }
    progressCallback_(percent, userData_);
}

void TranscriptionSink::succeed() {
    if (finished_.exchange(true) || !resultCallback_) {
        return;
    }
    resultCallback_(nullptr, nullptr, 0.0, 0.0, userData_);
}

void TranscriptionSink::fail(const std::string& message) {
    if (finished_.exchange(true) || !resultCallback_) {
        return;
    }
    resultCallback_(nullptr, message.c_str(), 0.0, 0.0, userData_);
}

// TranslationSink

TranslationSink::TranslationSink(soksak_translate_result_callback resultCallback, void* userData)
    : resultCallback_(resultCallback)
    , userData_(userData)
    , finished_(false) {
}

TranslationSink::~TranslationSink() {
    if (!finished_) {
        utils::Logger::warn("Translation request dropped without a terminal callback");
        fail(kTranslationEndedWithoutResult);
    }
}

void TranslationSink::succeed(const std::string& translatedText) {
    if (finished_.exchange(true) || !resultCallback_) {
        return;
    }
    resultCallback_(userData_, translatedText.c_str(), nullptr);
}

void TranslationSink::fail(const std::string& message) {
    if (finished_.exchange(true) || !resultCallback_) {
        return;
    }
    resultCallback_(userData_, nullptr, message.c_str());
}

// Progress and sequencing

std::optional<double> computeProgressPercent(double lastSegmentEndSeconds, double durationSeconds) {
    if (!(durationSeconds > 0.0)) {
        return std::nullopt;
    }
    double percent = 100.0 * lastSegmentEndSeconds / durationSeconds;
    return std::clamp(percent, 0.0, 100.0);
}

SegmentSequencer::SegmentSequencer(double durationSeconds)
    : durationSeconds_(durationSeconds)
    , lastStart_(0.0)
    , lastEnd_(0.0)
    , accepted_(0) {
}

std::optional<stt::TranscriptionSegment> SegmentSequencer::accept(const stt::TranscriptionSegment& segment) {
    std::string text = trim(segment.text);
    if (text.empty()) {
        return std::nullopt;
    }

    double start = std::max(segment.startSeconds, lastStart_);
    double end = std::max({segment.endSeconds, start, lastEnd_});

    lastStart_ = start;
    lastEnd_ = end;
    accepted_++;
    return stt::TranscriptionSegment(std::move(text), start, end);
}

std::optional<double> SegmentSequencer::currentProgress() const {
    if (accepted_ == 0) {
        return std::nullopt;
    }
    return computeProgressPercent(lastEnd_, durationSeconds_);
}

} // namespace bridge
} // namespace soksak
