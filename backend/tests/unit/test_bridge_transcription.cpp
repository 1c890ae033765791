#include <gtest/gtest.h>
#include "bridge/bridge_service.hpp"
#include "bridge/soksak_bridge.h"
#include "fixtures/fake_backends.hpp"
#include <atomic>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <unistd.h>

using namespace soksak;
using namespace soksak::test;

class BridgeTranscriptionTest : public ::testing::Test {
protected:
    void SetUp() override {
        installEngine({
            stt::TranscriptionSegment(" Hello", 0.0, 2.0),
            stt::TranscriptionSegment(" there", 2.0, 5.0),
            stt::TranscriptionSegment(" friend.", 5.0, 10.0)
        });
        context = soksak_create_context(nullptr, "base", nullptr);
        ASSERT_NE(context, nullptr);
    }

    void TearDown() override {
        if (context) {
            soksak_release_context(context);
        }
        bridge::BridgeService::getInstance().drain();
        bridge::BridgeService::getInstance().resetBackends();
    }

    void installEngine(std::vector<stt::TranscriptionSegment> segments, double durationSeconds = 10.0) {
        engine = std::make_shared<FakeSpeechEngine>(std::move(segments));
        factory = std::make_shared<FakeEngineFactory>(engine);
        decoder = std::make_shared<FakeAudioDecoder>(durationSeconds);

        bridge::Backends backends;
        backends.engineFactory = factory;
        backends.audioDecoder = decoder;
        backends.languageIdentifier = std::make_shared<mt::LanguageDetector>();
        backends.translationFactory = std::make_shared<FakeTranslationFactory>();
        bridge::BridgeService::getInstance().setBackends(backends);
    }

    void transcribe(const char* path, TranscriptionRecorder& recorder) {
        soksak_transcribe(context, path, &TranscriptionRecorder::onResult,
                          &TranscriptionRecorder::onProgress, &recorder);
    }

    soksak_context* context = nullptr;
    std::shared_ptr<FakeSpeechEngine> engine;
    std::shared_ptr<FakeEngineFactory> factory;
    std::shared_ptr<FakeAudioDecoder> decoder;
};

TEST_F(BridgeTranscriptionTest, StreamsSegmentsThenOneSuccessfulTerminalCall) {
    TranscriptionRecorder recorder;
    transcribe("speech.wav", recorder);
    ASSERT_TRUE(recorder.waitForTerminal());

    std::lock_guard<std::mutex> lock(recorder.mutex);
    ASSERT_EQ(recorder.events.size(), 4u);
    EXPECT_EQ(recorder.terminalCount, 1);

    EXPECT_EQ(recorder.events[0].text, "Hello");
    EXPECT_EQ(recorder.events[1].text, "there");
    EXPECT_EQ(recorder.events[2].text, "friend.");
    for (size_t i = 0; i < 3; ++i) {
        EXPECT_FALSE(recorder.events[i].terminal);
        EXPECT_FALSE(recorder.events[i].hasError);
    }

    const auto& last = recorder.events.back();
    EXPECT_TRUE(last.terminal);
    EXPECT_FALSE(last.hasError);
    EXPECT_DOUBLE_EQ(last.start, 0.0);
    EXPECT_DOUBLE_EQ(last.end, 0.0);
}

TEST_F(BridgeTranscriptionTest, ReportsProgressFromSegmentEnds) {
    TranscriptionRecorder recorder;
    transcribe("speech.wav", recorder);
    ASSERT_TRUE(recorder.waitForTerminal());

    std::lock_guard<std::mutex> lock(recorder.mutex);
    ASSERT_EQ(recorder.progress.size(), 3u);
    EXPECT_NEAR(recorder.progress[0], 20.0, 1e-9);
    EXPECT_NEAR(recorder.progress[1], 50.0, 1e-9);
    EXPECT_NEAR(recorder.progress[2], 100.0, 1e-9);
}

TEST_F(BridgeTranscriptionTest, SegmentTimesNeverDecrease) {
    installEngine({
        stt::TranscriptionSegment("one", 0.0, 3.0),
        stt::TranscriptionSegment("two", 2.0, 2.5),
        stt::TranscriptionSegment("three", 4.0, 5.0),
        stt::TranscriptionSegment("four", 4.5, 12.0)
    });

    TranscriptionRecorder recorder;
    transcribe("speech.wav", recorder);
    ASSERT_TRUE(recorder.waitForTerminal());

    std::lock_guard<std::mutex> lock(recorder.mutex);
    double previousStart = 0.0;
    double previousEnd = 0.0;
    size_t segments = 0;
    for (const auto& event : recorder.events) {
        if (event.terminal) {
            continue;
        }
        segments++;
        EXPECT_GE(event.start, previousStart);
        EXPECT_GE(event.end, previousEnd);
        EXPECT_GE(event.end, event.start);
        previousStart = event.start;
        previousEnd = event.end;
    }
    EXPECT_EQ(segments, 4u);

    // end past the audio duration is clamped to 100 percent
    ASSERT_FALSE(recorder.progress.empty());
    EXPECT_DOUBLE_EQ(recorder.progress.back(), 100.0);
}

TEST_F(BridgeTranscriptionTest, BlankSegmentsAreNotDelivered) {
    installEngine({
        stt::TranscriptionSegment("   ", 0.0, 1.0),
        stt::TranscriptionSegment("words", 1.0, 2.0),
        stt::TranscriptionSegment("", 2.0, 3.0)
    });

    TranscriptionRecorder recorder;
    transcribe("speech.wav", recorder);
    ASSERT_TRUE(recorder.waitForTerminal());

    std::lock_guard<std::mutex> lock(recorder.mutex);
    ASSERT_EQ(recorder.events.size(), 2u);
    EXPECT_EQ(recorder.events[0].text, "words");
    EXPECT_TRUE(recorder.events[1].terminal);
}

TEST_F(BridgeTranscriptionTest, UnreadableAudioFailsWithNativeMessage) {
    TranscriptionRecorder recorder;
    transcribe("/tmp/unreadable.wav", recorder);
    ASSERT_TRUE(recorder.waitForTerminal());

    std::lock_guard<std::mutex> lock(recorder.mutex);
    ASSERT_EQ(recorder.events.size(), 1u);
    EXPECT_TRUE(recorder.events[0].terminal);
    EXPECT_TRUE(recorder.events[0].hasError);
    EXPECT_EQ(recorder.events[0].error, "Failed to open audio file: /tmp/unreadable.wav");
    EXPECT_EQ(factory->createCalls.load(), 0);
}

TEST_F(BridgeTranscriptionTest, EmptyAudioSucceedsWithoutInvokingEngine) {
    installEngine({stt::TranscriptionSegment("never", 0.0, 1.0)}, 0.0);

    TranscriptionRecorder recorder;
    transcribe("silence.wav", recorder);
    ASSERT_TRUE(recorder.waitForTerminal());

    std::lock_guard<std::mutex> lock(recorder.mutex);
    ASSERT_EQ(recorder.events.size(), 1u);
    EXPECT_TRUE(recorder.events[0].terminal);
    EXPECT_FALSE(recorder.events[0].hasError);
    EXPECT_TRUE(recorder.progress.empty());
    EXPECT_EQ(engine->transcribeCalls.load(), 0);
}

TEST_F(BridgeTranscriptionTest, DecodeFailureEndsWithSingleErrorAfterSegments) {
    engine->failAfterSegments("decoder ran out of memory");

    TranscriptionRecorder recorder;
    transcribe("speech.wav", recorder);
    ASSERT_TRUE(recorder.waitForTerminal());
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    std::lock_guard<std::mutex> lock(recorder.mutex);
    EXPECT_EQ(recorder.terminalCount, 1);
    ASSERT_EQ(recorder.events.size(), 4u);
    EXPECT_TRUE(recorder.events.back().terminal);
    EXPECT_EQ(recorder.events.back().error, "decoder ran out of memory");
}

TEST_F(BridgeTranscriptionTest, EngineFailureIsNotCachedAndRetrySucceeds) {
    factory->failNext(1);

    TranscriptionRecorder first;
    transcribe("speech.wav", first);
    ASSERT_TRUE(first.waitForTerminal());
    {
        std::lock_guard<std::mutex> lock(first.mutex);
        ASSERT_EQ(first.events.size(), 1u);
        EXPECT_EQ(first.events[0].error, "Failed to load whisper model: fake-model.bin");
    }

    TranscriptionRecorder second;
    transcribe("speech.wav", second);
    ASSERT_TRUE(second.waitForTerminal());
    {
        std::lock_guard<std::mutex> lock(second.mutex);
        EXPECT_EQ(second.events.size(), 4u);
        EXPECT_FALSE(second.events.back().hasError);
    }
    EXPECT_EQ(factory->createCalls.load(), 2);
}

TEST_F(BridgeTranscriptionTest, ConcurrentFirstCallsConstructEngineOnce) {
    factory->setDelay(std::chrono::milliseconds(200));

    TranscriptionRecorder first;
    TranscriptionRecorder second;
    transcribe("a.wav", first);
    transcribe("b.wav", second);

    ASSERT_TRUE(first.waitForTerminal());
    ASSERT_TRUE(second.waitForTerminal());

    EXPECT_EQ(factory->createCalls.load(), 1);
    EXPECT_EQ(engine->transcribeCalls.load(), 2);
    std::lock_guard<std::mutex> lockFirst(first.mutex);
    std::lock_guard<std::mutex> lockSecond(second.mutex);
    EXPECT_FALSE(first.events.back().hasError);
    EXPECT_FALSE(second.events.back().hasError);
}

TEST_F(BridgeTranscriptionTest, EngineIsReusedAcrossCalls) {
    for (int i = 0; i < 3; ++i) {
        TranscriptionRecorder recorder;
        transcribe("speech.wav", recorder);
        ASSERT_TRUE(recorder.waitForTerminal());
    }
    EXPECT_EQ(factory->createCalls.load(), 1);
    EXPECT_EQ(engine->transcribeCalls.load(), 3);
}

TEST_F(BridgeTranscriptionTest, FixedLanguageAndDecodePolicyReachEngine) {
    soksak_release_context(context);
    context = soksak_create_context(nullptr, "small", "ko");

    TranscriptionRecorder recorder;
    transcribe("speech.wav", recorder);
    ASSERT_TRUE(recorder.waitForTerminal());

    auto options = engine->getLastOptions();
    ASSERT_TRUE(options.has_value());
    ASSERT_TRUE(options->language.has_value());
    EXPECT_EQ(*options->language, "ko");
    EXPECT_EQ(options->concurrentWorkerCount, 0);
    EXPECT_EQ(options->chunking, stt::ChunkingStrategy::VAD);
    EXPECT_TRUE(options->suppressBlank);
    EXPECT_TRUE(options->skipSpecialTokens);
    EXPECT_FLOAT_EQ(options->temperature, 0.0f);
    EXPECT_EQ(options->temperatureFallbackCount, 0);
}

TEST_F(BridgeTranscriptionTest, AutoDetectsLanguageWhenNoneFixed) {
    TranscriptionRecorder recorder;
    transcribe("speech.wav", recorder);
    ASSERT_TRUE(recorder.waitForTerminal());

    auto options = engine->getLastOptions();
    ASSERT_TRUE(options.has_value());
    EXPECT_FALSE(options->language.has_value());
}

TEST_F(BridgeTranscriptionTest, ModelSourceIsPassedToFactory) {
    soksak_release_context(context);
    context = soksak_create_context("/opt/models/ggml-large.bin", "base", "");

    TranscriptionRecorder recorder;
    transcribe("speech.wav", recorder);
    ASSERT_TRUE(recorder.waitForTerminal());

    stt::ModelSource source = factory->getLastSource();
    ASSERT_TRUE(source.modelPath.has_value());
    EXPECT_EQ(*source.modelPath, "/opt/models/ggml-large.bin");
}

TEST_F(BridgeTranscriptionTest, ReleaseWhileInFlightStillDeliversTerminal) {
    factory->setDelay(std::chrono::milliseconds(150));

    TranscriptionRecorder recorder;
    transcribe("speech.wav", recorder);
    soksak_release_context(context);
    context = nullptr;

    ASSERT_TRUE(recorder.waitForTerminal());
    std::lock_guard<std::mutex> lock(recorder.mutex);
    EXPECT_EQ(recorder.terminalCount, 1);
    EXPECT_FALSE(recorder.events.back().hasError);
}

TEST_F(BridgeTranscriptionTest, NullContextFailsThroughCallback) {
    TranscriptionRecorder recorder;
    soksak_transcribe(nullptr, "speech.wav", &TranscriptionRecorder::onResult,
                      &TranscriptionRecorder::onProgress, &recorder);
    ASSERT_TRUE(recorder.waitForTerminal());

    std::lock_guard<std::mutex> lock(recorder.mutex);
    ASSERT_EQ(recorder.events.size(), 1u);
    EXPECT_EQ(recorder.events[0].error, "Invalid context handle");
}

TEST_F(BridgeTranscriptionTest, NullAudioPathFailsThroughCallback) {
    TranscriptionRecorder recorder;
    transcribe(nullptr, recorder);
    ASSERT_TRUE(recorder.waitForTerminal());

    std::lock_guard<std::mutex> lock(recorder.mutex);
    ASSERT_EQ(recorder.events.size(), 1u);
    EXPECT_EQ(recorder.events[0].error, "Audio path is missing");
}

TEST_F(BridgeTranscriptionTest, MissingResultCallbackSchedulesNothing) {
    soksak_transcribe(context, "speech.wav", nullptr, &TranscriptionRecorder::onProgress, nullptr);
    bridge::BridgeService::getInstance().drain();
    EXPECT_EQ(decoder->decodeCalls.load(), 0);
}

TEST_F(BridgeTranscriptionTest, ProgressCallbackIsOptional) {
    TranscriptionRecorder recorder;
    soksak_transcribe(context, "speech.wav", &TranscriptionRecorder::onResult, nullptr, &recorder);
    ASSERT_TRUE(recorder.waitForTerminal());

    std::lock_guard<std::mutex> lock(recorder.mutex);
    EXPECT_EQ(recorder.events.size(), 4u);
    EXPECT_TRUE(recorder.progress.empty());
}

namespace {

// Reconfigures the bridge from inside the terminal callback, then records it
struct ReconfiguringRecorder {
    TranscriptionRecorder recorder;
    std::string configPath;
    std::atomic<int> configureResult{1};

    static void onResult(const char* text, const char* error, double start, double end, void* userData) {
        auto* self = static_cast<ReconfiguringRecorder*>(userData);
        if (!text) {
            self->configureResult = soksak_configure(self->configPath.c_str());
        }
        TranscriptionRecorder::onResult(text, error, start, end, &self->recorder);
    }

    static void onProgress(double percent, void* userData) {
        TranscriptionRecorder::onProgress(percent, &static_cast<ReconfiguringRecorder*>(userData)->recorder);
    }
};

} // namespace

TEST_F(BridgeTranscriptionTest, ReconfiguringWorkerCountFromCallbackKeepsBridgeUsable) {
    auto& service = bridge::BridgeService::getInstance();
    utils::Config original = service.getConfig();

    // Start the pool so the new worker count forces a resize
    {
        TranscriptionRecorder warmup;
        transcribe("speech.wav", warmup);
        ASSERT_TRUE(warmup.waitForTerminal());
    }
    size_t resized = service.getWorkerCount() + 1;

    ReconfiguringRecorder reconfiguring;
    reconfiguring.configPath = (std::filesystem::temp_directory_path() /
        ("soksak_reconfigure_" + std::to_string(::getpid()) + ".json")).string();
    {
        std::ofstream out(reconfiguring.configPath);
        out << "{\"workerThreads\": " << resized << "}";
    }

    soksak_transcribe(context, "speech.wav", &ReconfiguringRecorder::onResult,
                      &ReconfiguringRecorder::onProgress, &reconfiguring);
    ASSERT_TRUE(reconfiguring.recorder.waitForTerminal());
    std::remove(reconfiguring.configPath.c_str());

    EXPECT_EQ(reconfiguring.configureResult.load(), 0);
    {
        std::lock_guard<std::mutex> lock(reconfiguring.recorder.mutex);
        EXPECT_EQ(reconfiguring.recorder.terminalCount, 1);
        EXPECT_FALSE(reconfiguring.recorder.events.back().hasError);
    }

    // Configuring drops the installed backends
    installEngine({stt::TranscriptionSegment(" Again", 0.0, 10.0)});
    soksak_context* fresh = soksak_create_context(nullptr, "base", nullptr);
    ASSERT_NE(fresh, nullptr);
    TranscriptionRecorder after;
    soksak_transcribe(fresh, "speech.wav", &TranscriptionRecorder::onResult,
                      &TranscriptionRecorder::onProgress, &after);
    bool finished = after.waitForTerminal();
    soksak_release_context(fresh);
    ASSERT_TRUE(finished);
    {
        std::lock_guard<std::mutex> lock(after.mutex);
        EXPECT_EQ(after.terminalCount, 1);
        EXPECT_FALSE(after.events.back().hasError);
        EXPECT_EQ(after.events.front().text, "Again");
    }
    EXPECT_EQ(service.getWorkerCount(), resized);

    service.drain();
    service.configure(original);
}

TEST_F(BridgeTranscriptionTest, VersionIsReported) {
    EXPECT_STREQ(soksak_version(), SOKSAK_BRIDGE_VERSION);
}
