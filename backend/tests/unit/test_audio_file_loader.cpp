#include <gtest/gtest.h>
#include "audio/audio_file_loader.hpp"
#include "utils/error_handler.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;
using namespace soksak;

namespace {

constexpr double kPi = 3.14159265358979323846;

template <typename T>
void writeLE(std::ofstream& out, T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
        out.put(static_cast<char>((static_cast<uint64_t>(value) >> (8 * i)) & 0xFF));
    }
}

// 16-bit PCM WAV holding a 440 Hz tone on every channel
void writeToneWav(const fs::path& path, uint32_t sampleRate, uint16_t channels, double seconds) {
    const uint32_t frames = static_cast<uint32_t>(sampleRate * seconds);
    const uint32_t dataSize = frames * channels * 2;

    std::ofstream out(path, std::ios::binary);
    out.write("RIFF", 4);
    writeLE<uint32_t>(out, 36 + dataSize);
    out.write("WAVE", 4);
    out.write("fmt ", 4);
    writeLE<uint32_t>(out, 16);
    writeLE<uint16_t>(out, 1);
    writeLE<uint16_t>(out, channels);
    writeLE<uint32_t>(out, sampleRate);
    writeLE<uint32_t>(out, sampleRate * channels * 2);
    writeLE<uint16_t>(out, static_cast<uint16_t>(channels * 2));
    writeLE<uint16_t>(out, 16);
    out.write("data", 4);
    writeLE<uint32_t>(out, dataSize);

    for (uint32_t i = 0; i < frames; ++i) {
        double value = 0.5 * std::sin(2.0 * kPi * 440.0 * i / sampleRate);
        int16_t sample = static_cast<int16_t>(value * 32767.0);
        for (uint16_t c = 0; c < channels; ++c) {
            writeLE<uint16_t>(out, static_cast<uint16_t>(sample));
        }
    }
}

} // namespace

class AudioFileLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / ("soksak_audio_test_" + std::to_string(::getpid()));
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path dir_;
    audio::AudioFileLoader loader;
};

TEST_F(AudioFileLoaderTest, DecodesMono16kWav) {
    fs::path path = dir_ / "tone.wav";
    writeToneWav(path, 16000, 1, 1.0);

    auto buffer = loader.decodeFile(path.string());

    EXPECT_EQ(buffer.sampleRate, audio::kTargetSampleRate);
    EXPECT_EQ(buffer.samples.size(), 16000u);
    EXPECT_NEAR(buffer.getDurationSeconds(), 1.0, 1e-6);

    float peak = 0.0f;
    for (float sample : buffer.samples) {
        peak = std::max(peak, std::fabs(sample));
    }
    EXPECT_NEAR(peak, 0.5f, 0.01f);
}

TEST_F(AudioFileLoaderTest, ResamplesAndDownmixes) {
    fs::path path = dir_ / "stereo-44k.wav";
    writeToneWav(path, 44100, 2, 2.0);

    auto buffer = loader.decodeFile(path.string());

    EXPECT_EQ(buffer.sampleRate, audio::kTargetSampleRate);
    EXPECT_NEAR(buffer.getDurationSeconds(), 2.0, 0.01);
}

TEST_F(AudioFileLoaderTest, MissingFileThrows) {
    try {
        loader.decodeFile((dir_ / "missing.wav").string());
        FAIL() << "expected AudioProcessingException";
    } catch (const utils::AudioProcessingException& e) {
        EXPECT_EQ(std::string(e.what()).rfind("Audio file not found", 0), 0u);
    }
}

TEST_F(AudioFileLoaderTest, UndecodableFileThrows) {
    fs::path path = dir_ / "notes.wav";
    {
        std::ofstream out(path);
        out << "this is not audio at all";
    }

    try {
        loader.decodeFile(path.string());
        FAIL() << "expected AudioProcessingException";
    } catch (const utils::AudioProcessingException& e) {
        EXPECT_EQ(std::string(e.what()).rfind("Failed to open audio file", 0), 0u);
    }
}
