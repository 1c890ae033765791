#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace soksak {
namespace mt {

/**
 * Language detection result containing detected language and confidence information
 */
struct LanguageDetectionResult {
    std::string detectedLanguage;   // empty when nothing was detected
    float confidence;
    std::vector<std::pair<std::string, float>> languageCandidates;
    bool isReliable;
    std::string detectionMethod;    // "script", "common_words", "none"

    LanguageDetectionResult()
        : confidence(0.0f)
        , isReliable(false)
        , detectionMethod("none") {}
};

/**
 * Identifies the dominant language of a piece of text.
 */
class LanguageIdentifier {
public:
    virtual ~LanguageIdentifier() = default;

    /**
     * ISO 639-1 code of the dominant language, or nullopt when the text
     * carries no usable evidence.
     */
    virtual std::optional<std::string> detectDominantLanguage(const std::string& text) = 0;
};

/**
 * Text analysis detector: Unicode script classification for non-Latin
 * writing systems, common-word scoring for Latin-script languages.
 */
class LanguageDetector : public LanguageIdentifier {
public:
    LanguageDetector();

    LanguageDetectionResult detectLanguage(const std::string& text) const;

    std::optional<std::string> detectDominantLanguage(const std::string& text) override;

    void setConfidenceThreshold(float threshold) { confidenceThreshold_ = threshold; }
    float getConfidenceThreshold() const { return confidenceThreshold_; }

    std::vector<std::string> getSupportedLanguages() const;
    bool isLanguageSupported(const std::string& languageCode) const;

private:
    LanguageDetectionResult detectFromScript(const std::vector<uint32_t>& codepoints) const;
    LanguageDetectionResult detectFromCommonWords(const std::string& text) const;

    void loadCommonWords();

    static std::vector<uint32_t> decodeUtf8(const std::string& text);
    static std::vector<std::string> extractWords(const std::string& text);

    std::unordered_map<std::string, std::unordered_set<std::string>> commonWords_;
    float confidenceThreshold_;
};

} // namespace mt
} // namespace soksak
