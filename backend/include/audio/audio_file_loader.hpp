#pragma once

#include <string>
#include <vector>

namespace soksak {
namespace audio {

constexpr int kTargetSampleRate = 16000;

/**
 * Decoded mono float32 PCM
 */
struct AudioBuffer {
    std::vector<float> samples;
    int sampleRate;

    AudioBuffer() : sampleRate(kTargetSampleRate) {}

    bool empty() const { return samples.empty(); }

    double getDurationSeconds() const {
        return sampleRate > 0 ? static_cast<double>(samples.size()) / sampleRate : 0.0;
    }
};

/**
 * Decodes an audio file to 16 kHz mono float samples.
 */
class AudioDecoder {
public:
    virtual ~AudioDecoder() = default;

    /**
     * Throws AudioProcessingException if the file cannot be read or decoded.
     */
    virtual AudioBuffer decodeFile(const std::string& path) = 0;
};

/**
 * miniaudio-backed decoder (WAV, FLAC and MP3), resampling and downmixing
 * on the fly.
 */
class AudioFileLoader : public AudioDecoder {
public:
    AudioBuffer decodeFile(const std::string& path) override;
};

} // namespace audio
} // namespace soksak
