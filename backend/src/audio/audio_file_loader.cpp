#include "audio/audio_file_loader.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

#include <miniaudio.h>

#include <filesystem>

namespace soksak {
namespace audio {

namespace {

constexpr ma_uint64 kChunkFrames = 16000;

class DecoderGuard {
public:
    explicit DecoderGuard(ma_decoder* decoder) : decoder_(decoder) {}
    ~DecoderGuard() { ma_decoder_uninit(decoder_); }

    DecoderGuard(const DecoderGuard&) = delete;
    DecoderGuard& operator=(const DecoderGuard&) = delete;

private:
    ma_decoder* decoder_;
};

} // namespace

AudioBuffer AudioFileLoader::decodeFile(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw utils::AudioProcessingException("Audio file not found", path);
    }

    ma_decoder decoder;
    ma_decoder_config config = ma_decoder_config_init(ma_format_f32, 1, kTargetSampleRate);
    ma_result result = ma_decoder_init_file(path.c_str(), &config, &decoder);
    if (result != MA_SUCCESS) {
        throw utils::AudioProcessingException(
            std::string("Failed to open audio file: ") + ma_result_description(result), path);
    }
    DecoderGuard guard(&decoder);

    AudioBuffer buffer;
    buffer.sampleRate = kTargetSampleRate;

    ma_uint64 expectedFrames = 0;
    if (ma_decoder_get_length_in_pcm_frames(&decoder, &expectedFrames) == MA_SUCCESS && expectedFrames > 0) {
        buffer.samples.reserve(static_cast<size_t>(expectedFrames));
    }

    std::vector<float> chunk(kChunkFrames);
    for (;;) {
        ma_uint64 framesRead = 0;
        result = ma_decoder_read_pcm_frames(&decoder, chunk.data(), kChunkFrames, &framesRead);
        buffer.samples.insert(buffer.samples.end(), chunk.begin(), chunk.begin() + static_cast<size_t>(framesRead));

        if (result != MA_SUCCESS && result != MA_AT_END) {
            throw utils::AudioProcessingException(
                std::string("Failed to decode audio: ") + ma_result_description(result), path);
        }
        if (result == MA_AT_END || framesRead < kChunkFrames) {
            break;
        }
    }

    utils::Logger::debug("Decoded " + path + ": " + std::to_string(buffer.samples.size()) +
                         " samples (" + std::to_string(buffer.getDurationSeconds()) + " s)");
    return buffer;
}

} // namespace audio
} // namespace soksak
