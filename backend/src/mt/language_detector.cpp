#include "mt/language_detector.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <map>

namespace soksak {
namespace mt {

namespace {

const char* const kScriptLanguages[] = {"ko", "ja", "zh", "ru", "ar", "el", "he", "th", "hi"};

enum class Script {
    LATIN,
    HANGUL,
    KANA,
    HAN,
    CYRILLIC,
    ARABIC,
    GREEK,
    HEBREW,
    THAI,
    DEVANAGARI,
    OTHER
};

Script classify(uint32_t cp) {
    if ((cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z') || (cp >= 0x00C0 && cp <= 0x024F)) {
        return cp == 0x00D7 || cp == 0x00F7 ? Script::OTHER : Script::LATIN;
    }
    if ((cp >= 0xAC00 && cp <= 0xD7AF) || (cp >= 0x1100 && cp <= 0x11FF) || (cp >= 0x3130 && cp <= 0x318F)) {
        return Script::HANGUL;
    }
    if (cp >= 0x3040 && cp <= 0x30FF) {
        return Script::KANA;
    }
    if ((cp >= 0x4E00 && cp <= 0x9FFF) || (cp >= 0x3400 && cp <= 0x4DBF)) {
        return Script::HAN;
    }
    if (cp >= 0x0400 && cp <= 0x04FF) {
        return Script::CYRILLIC;
    }
    if (cp >= 0x0600 && cp <= 0x06FF) {
        return Script::ARABIC;
    }
    if (cp >= 0x0370 && cp <= 0x03FF) {
        return Script::GREEK;
    }
    if (cp >= 0x0590 && cp <= 0x05FF) {
        return Script::HEBREW;
    }
    if (cp >= 0x0E00 && cp <= 0x0E7F) {
        return Script::THAI;
    }
    if (cp >= 0x0900 && cp <= 0x097F) {
        return Script::DEVANAGARI;
    }
    return Script::OTHER;
}

bool isWordSeparator(unsigned char c) {
    return c < 0x80 && !std::isalnum(c) && c != '\'';
}

} // namespace

LanguageDetector::LanguageDetector()
    : confidenceThreshold_(0.5f) {
    loadCommonWords();
}

std::vector<std::string> LanguageDetector::getSupportedLanguages() const {
    std::vector<std::string> languages;
    for (const auto& entry : commonWords_) {
        languages.push_back(entry.first);
    }
    for (const char* code : kScriptLanguages) {
        languages.emplace_back(code);
    }
    std::sort(languages.begin(), languages.end());
    return languages;
}

bool LanguageDetector::isLanguageSupported(const std::string& languageCode) const {
    auto languages = getSupportedLanguages();
    return std::find(languages.begin(), languages.end(), languageCode) != languages.end();
}

std::optional<std::string> LanguageDetector::detectDominantLanguage(const std::string& text) {
    LanguageDetectionResult result = detectLanguage(text);
    if (result.detectedLanguage.empty() || !result.isReliable) {
        utils::Logger::debug("No dominant language detected (method " + result.detectionMethod + ")");
        return std::nullopt;
    }
    return result.detectedLanguage;
}

LanguageDetectionResult LanguageDetector::detectLanguage(const std::string& text) const {
    std::vector<uint32_t> codepoints = decodeUtf8(text);

    LanguageDetectionResult scriptResult = detectFromScript(codepoints);
    if (!scriptResult.detectedLanguage.empty()) {
        return scriptResult;
    }
    return detectFromCommonWords(text);
}

LanguageDetectionResult LanguageDetector::detectFromScript(const std::vector<uint32_t>& codepoints) const {
    LanguageDetectionResult result;
    result.detectionMethod = "script";

    std::map<Script, size_t> counts;
    size_t letters = 0;
    for (uint32_t cp : codepoints) {
        Script script = classify(cp);
        if (script != Script::OTHER) {
            counts[script]++;
            letters++;
        }
    }
    if (letters == 0) {
        return result;
    }

    // Japanese mixes kana with Han; any kana makes the Han count Japanese
    if (counts[Script::KANA] > 0) {
        counts[Script::KANA] += counts[Script::HAN];
        counts[Script::HAN] = 0;
    }

    static const std::pair<Script, const char*> kScriptToLanguage[] = {
        {Script::HANGUL, "ko"}, {Script::KANA, "ja"}, {Script::HAN, "zh"},
        {Script::CYRILLIC, "ru"}, {Script::ARABIC, "ar"}, {Script::GREEK, "el"},
        {Script::HEBREW, "he"}, {Script::THAI, "th"}, {Script::DEVANAGARI, "hi"}
    };

    for (const auto& entry : kScriptToLanguage) {
        size_t count = counts[entry.first];
        if (count == 0) {
            continue;
        }
        float share = static_cast<float>(count) / static_cast<float>(letters);
        result.languageCandidates.emplace_back(entry.second, share);
    }
    std::sort(result.languageCandidates.begin(), result.languageCandidates.end(),
        [](const auto& a, const auto& b) { return a.second > b.second; });

    if (!result.languageCandidates.empty() && result.languageCandidates.front().second > 0.5f) {
        result.detectedLanguage = result.languageCandidates.front().first;
        result.confidence = result.languageCandidates.front().second;
        result.isReliable = true;
    }
    return result;
}

LanguageDetectionResult LanguageDetector::detectFromCommonWords(const std::string& text) const {
    LanguageDetectionResult result;
    result.detectionMethod = "common_words";

    std::vector<std::string> words = extractWords(text);
    if (words.empty()) {
        return result;
    }

    std::map<std::string, float> scores;
    float total = 0.0f;
    for (const auto& word : words) {
        for (const auto& entry : commonWords_) {
            if (entry.second.count(word) > 0) {
                scores[entry.first] += 1.0f;
                total += 1.0f;
            }
        }
    }
    if (total == 0.0f) {
        return result;
    }

    for (const auto& score : scores) {
        result.languageCandidates.emplace_back(score.first, score.second / total);
    }
    std::sort(result.languageCandidates.begin(), result.languageCandidates.end(),
        [](const auto& a, const auto& b) {
            return a.second != b.second ? a.second > b.second : a.first < b.first;
        });

    const auto& best = result.languageCandidates.front();
    bool tied = result.languageCandidates.size() > 1 && result.languageCandidates[1].second == best.second;
    if (tied) {
        return result;
    }

    result.detectedLanguage = best.first;
    result.confidence = best.second;
    result.isReliable = result.confidence >= confidenceThreshold_ ||
                        result.languageCandidates.size() == 1;
    return result;
}

std::vector<uint32_t> LanguageDetector::decodeUtf8(const std::string& text) {
    std::vector<uint32_t> codepoints;
    codepoints.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        unsigned char lead = static_cast<unsigned char>(text[i]);
        uint32_t cp = 0;
        size_t extra = 0;
        if (lead < 0x80) {
            cp = lead;
        } else if ((lead & 0xE0) == 0xC0) {
            cp = lead & 0x1F;
            extra = 1;
        } else if ((lead & 0xF0) == 0xE0) {
            cp = lead & 0x0F;
            extra = 2;
        } else if ((lead & 0xF8) == 0xF0) {
            cp = lead & 0x07;
            extra = 3;
        } else {
            ++i;
            continue;
        }

        if (i + extra >= text.size()) {
            break;  // truncated sequence
        }
        bool valid = true;
        for (size_t k = 1; k <= extra; ++k) {
            unsigned char cont = static_cast<unsigned char>(text[i + k]);
            if ((cont & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (cont & 0x3F);
        }
        if (valid) {
            codepoints.push_back(cp);
            i += extra + 1;
        } else {
            ++i;
        }
    }
    return codepoints;
}

std::vector<std::string> LanguageDetector::extractWords(const std::string& text) {
    std::vector<std::string> words;
    std::string current;
    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (isWordSeparator(c) || std::isspace(c)) {
            if (!current.empty()) {
                words.push_back(current);
                current.clear();
            }
            continue;
        }
        current += c < 0x80 ? static_cast<char>(std::tolower(c)) : ch;
    }
    if (!current.empty()) {
        words.push_back(current);
    }

    // Digits alone carry no language evidence
    words.erase(std::remove_if(words.begin(), words.end(), [](const std::string& w) {
        return std::all_of(w.begin(), w.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
    }), words.end());
    return words;
}

void LanguageDetector::loadCommonWords() {
    commonWords_["en"] = {
        "the", "be", "to", "of", "and", "in", "that", "have", "it", "for",
        "not", "on", "with", "he", "as", "you", "do", "at", "this", "but",
        "his", "by", "from", "they", "we", "say", "her", "she", "or", "will",
        "my", "one", "all", "would", "there", "their", "is", "are", "was",
        "hello", "world", "what", "how", "over", "quick", "thank", "thanks", "good"
    };

    commonWords_["es"] = {
        "el", "los", "las", "del", "que", "y", "una", "por", "con", "para",
        "es", "son", "está", "están", "pero", "muy", "sin", "sobre", "este",
        "cuando", "más", "hola", "mundo", "gracias", "buenos", "días", "yo", "tengo"
    };

    commonWords_["fr"] = {
        "le", "les", "et", "à", "il", "être", "avoir", "pour", "dans", "ce",
        "une", "sur", "avec", "ne", "pas", "tout", "plus", "mais", "ou", "nous",
        "vous", "je", "est", "sont", "du", "des", "au", "aux", "bonjour",
        "monde", "merci", "oui", "très", "c'est", "suis"
    };

    commonWords_["de"] = {
        "der", "die", "und", "den", "von", "zu", "das", "mit", "sich", "des",
        "auf", "für", "ist", "im", "dem", "nicht", "ein", "eine", "auch", "werden",
        "aus", "hat", "dass", "nach", "wird", "bei", "einer", "sind", "noch",
        "wie", "hallo", "welt", "danke", "ich", "bin"
    };

    commonWords_["it"] = {
        "il", "gli", "di", "che", "è", "non", "per", "sono", "mi", "questo",
        "della", "delle", "nel", "ciao", "mondo", "grazie", "anche", "come", "molto"
    };

    commonWords_["pt"] = {
        "o", "os", "não", "uma", "para", "com", "mais", "você", "obrigado",
        "obrigada", "olá", "mundo", "muito", "também", "isso", "estou", "são"
    };

    commonWords_["nl"] = {
        "de", "het", "een", "van", "ik", "je", "niet", "dat", "wat", "zijn",
        "hallo", "wereld", "dank", "bedankt", "maar", "ook", "heb", "hoe"
    };
}

} // namespace mt
} // namespace soksak
