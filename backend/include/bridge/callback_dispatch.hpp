#pragma once

#include "bridge/soksak_bridge.h"
#include "stt/stt_interface.hpp"

#include <atomic>
#include <optional>
#include <string>

namespace soksak {
namespace bridge {

extern const char* const kTranscriptionEndedWithoutResult;
extern const char* const kTranslationEndedWithoutResult;

/**
 * Owns the host callbacks of one transcription request.
 *
 * At most one terminal call is delivered and nothing is delivered after it.
 * A sink destroyed before a terminal call reports a failure, so every
 * request ends with exactly one terminal callback.
 */
class TranscriptionSink {
public:
    TranscriptionSink(soksak_transcribe_result_callback resultCallback,
                      soksak_transcribe_progress_callback progressCallback,
                      void* userData);
    ~TranscriptionSink();

    TranscriptionSink(const TranscriptionSink&) = delete;
    TranscriptionSink& operator=(const TranscriptionSink&) = delete;

    void segment(const stt::TranscriptionSegment& segment);
    void progress(double percent);

    void succeed();
    void fail(const std::string& message);

    bool isFinished() const { return finished_; }

private:
    soksak_transcribe_result_callback resultCallback_;
    soksak_transcribe_progress_callback progressCallback_;
    void* userData_;
    std::atomic<bool> finished_;
};

/**
 * Owns the host callback of one translation request. Same terminal-call
 * discipline as TranscriptionSink.
 */
class TranslationSink {
public:
    TranslationSink(soksak_translate_result_callback resultCallback, void* userData);
    ~TranslationSink();

    TranslationSink(const TranslationSink&) = delete;
    TranslationSink& operator=(const TranslationSink&) = delete;

    void succeed(const std::string& translatedText);
    void fail(const std::string& message);

    bool isFinished() const { return finished_; }

private:
    soksak_translate_result_callback resultCallback_;
    void* userData_;
    std::atomic<bool> finished_;
};

/**
 * 100 * lastSegmentEnd / duration, clamped to [0, 100]. nullopt when the
 * duration is not positive.
 */
std::optional<double> computeProgressPercent(double lastSegmentEndSeconds, double durationSeconds);

/**
 * Normalizes the segment stream of one transcription: drops blank segments,
 * trims text and keeps start and end times non-decreasing.
 */
class SegmentSequencer {
public:
    explicit SegmentSequencer(double durationSeconds);

    /**
     * The segment to deliver, or nullopt if it carries no text.
     */
    std::optional<stt::TranscriptionSegment> accept(const stt::TranscriptionSegment& segment);

    // Progress after the last accepted segment
    std::optional<double> currentProgress() const;

    size_t getAcceptedCount() const { return accepted_; }

private:
    double durationSeconds_;
    double lastStart_;
    double lastEnd_;
    size_t accepted_;
};

} // namespace bridge
} // namespace soksak
