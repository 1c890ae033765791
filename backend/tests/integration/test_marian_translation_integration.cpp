#include <gtest/gtest.h>
#include "bridge/soksak_bridge.h"
#include "fixtures/fake_backends.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;
using soksak::test::TranslationRecorder;

/**
 * Translates with installed Marian models through the C interface. Needs
 * SOKSAK_TEST_MARIAN_DIR holding an fr-en model directory; skipped
 * otherwise.
 */
class MarianTranslationIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        const char* modelsDir = std::getenv("SOKSAK_TEST_MARIAN_DIR");
        if (!modelsDir) {
            GTEST_SKIP() << "SOKSAK_TEST_MARIAN_DIR not set";
        }

        configPath_ = fs::temp_directory_path() / ("soksak_marian_it_" + std::to_string(::getpid()) + ".json");
        std::ofstream out(configPath_);
        out << "{\"translationModelsPath\": \"" << modelsDir << "\", \"logLevel\": \"WARN\"}";
        out.close();
        ASSERT_EQ(soksak_configure(configPath_.string().c_str()), 0);
    }

    void TearDown() override {
        if (!configPath_.empty()) {
            std::error_code ec;
            fs::remove(configPath_, ec);
        }
    }

    fs::path configPath_;
};

TEST_F(MarianTranslationIntegrationTest, TranslatesWithExplicitSource) {
    TranslationRecorder recorder;
    soksak_translate("Bonjour le monde", "fr", "en", &recorder, &TranslationRecorder::onResult);
    ASSERT_TRUE(recorder.waitForResult(std::chrono::minutes(2)));

    std::lock_guard<std::mutex> lock(recorder.mutex);
    EXPECT_EQ(recorder.calls, 1);
    EXPECT_FALSE(recorder.error.has_value()) << *recorder.error;
    ASSERT_TRUE(recorder.text.has_value());
    EXPECT_FALSE(recorder.text->empty());
}

TEST_F(MarianTranslationIntegrationTest, DetectsSourceLanguage) {
    TranslationRecorder recorder;
    soksak_translate("Bonjour le monde", nullptr, "en", &recorder, &TranslationRecorder::onResult);
    ASSERT_TRUE(recorder.waitForResult(std::chrono::minutes(2)));

    std::lock_guard<std::mutex> lock(recorder.mutex);
    EXPECT_FALSE(recorder.error.has_value()) << *recorder.error;
    ASSERT_TRUE(recorder.text.has_value());
}

TEST_F(MarianTranslationIntegrationTest, UninstalledPairReportsInstallHint) {
    TranslationRecorder recorder;
    soksak_translate("Bonjour", "fr", "zu", &recorder, &TranslationRecorder::onResult);
    ASSERT_TRUE(recorder.waitForResult());

    std::lock_guard<std::mutex> lock(recorder.mutex);
    ASSERT_TRUE(recorder.error.has_value());
    EXPECT_EQ(recorder.error->rfind("Language model not installed.", 0), 0u);
}
