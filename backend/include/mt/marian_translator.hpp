#pragma once

#include "mt/translation_interface.hpp"
#include "utils/config.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace soksak {
namespace mt {

/**
 * Files making up an installed Marian model for one direction
 */
struct MarianModelFiles {
    std::string directory;
    std::string modelFile;
    std::vector<std::string> vocabs;  // source vocab, target vocab
};

class MarianModelStore;
struct LoadedMarianModel;

/**
 * Translation session backed by a Marian NMT model under
 * <translationModelsPath>/<src>-<tgt>/.
 */
class MarianTranslator : public TranslationSession {
public:
    MarianTranslator(std::string sourceLang, std::string targetLang,
                     std::shared_ptr<MarianModelStore> store);

    void prepare() override;
    std::string translate(const std::string& text) override;

    std::string getSourceLang() const override { return sourceLang_; }
    std::string getTargetLang() const override { return targetLang_; }

private:
    std::string sourceLang_;
    std::string targetLang_;
    std::shared_ptr<MarianModelStore> store_;
    std::shared_ptr<LoadedMarianModel> model_;
};

/**
 * Locates installed models and keeps loaded ones for reuse across sessions.
 */
class MarianModelStore {
public:
    explicit MarianModelStore(const utils::Config& config);

    /**
     * Files of the installed model for a pair, or nullopt when the model
     * or its vocabulary is missing.
     */
    std::optional<MarianModelFiles> locate(const std::string& sourceLang,
                                           const std::string& targetLang) const;

    std::string pairDirectory(const std::string& sourceLang, const std::string& targetLang) const;

    /**
     * Loaded model for a pair, loading it on first use.
     * @throws LanguageResourceNotInstalledException, TranslationException
     */
    std::shared_ptr<LoadedMarianModel> acquire(const std::string& sourceLang,
                                               const std::string& targetLang);

    std::vector<std::string> buildArguments(const MarianModelFiles& files) const;

private:
    utils::Config config_;
    std::mutex mutex_;
    std::map<std::pair<std::string, std::string>, std::shared_ptr<LoadedMarianModel>> loaded_;
};

class MarianTranslatorFactory : public TranslationSessionFactory {
public:
    explicit MarianTranslatorFactory(const utils::Config& config);

    std::unique_ptr<TranslationSession> createSession(const std::string& sourceLang,
                                                      const std::string& targetLang) override;

private:
    std::shared_ptr<MarianModelStore> store_;
};

} // namespace mt
} // namespace soksak
