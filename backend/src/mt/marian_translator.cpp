#include "mt/marian_translator.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

#include "marian.h"
#include "common/config.h"
#include "translator/beam_search.h"
#include "translator/translator.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <initializer_list>
#include <thread>

namespace fs = std::filesystem;

namespace soksak {
namespace mt {

struct LoadedMarianModel {
    marian::Ptr<marian::TranslateService<marian::BeamSearch>> service;
    std::mutex mutex;  // one translation at a time per loaded model
};

namespace {

std::optional<std::string> firstExisting(const fs::path& dir, std::initializer_list<const char*> names) {
    std::error_code ec;
    for (const char* name : names) {
        fs::path candidate = dir / name;
        if (fs::is_regular_file(candidate, ec)) {
            return candidate.string();
        }
    }
    return std::nullopt;
}

std::vector<fs::path> filesWithExtension(const fs::path& dir, const std::string& extension) {
    std::vector<fs::path> files;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && it->path().extension() == extension) {
            files.push_back(it->path());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

bool looksLikeAuxiliaryFile(const fs::path& file) {
    std::string name = file.filename().string();
    return name.find("vocab") != std::string::npos || name.find("lex") != std::string::npos;
}

std::string trimTrailingWhitespace(std::string text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.pop_back();
    }
    return text;
}

} // namespace

// MarianModelStore

MarianModelStore::MarianModelStore(const utils::Config& config)
    : config_(config) {
    // Marian aborts the process on fatal errors unless told to throw
    marian::setThrowExceptionOnAbort(true);
}

std::string MarianModelStore::pairDirectory(const std::string& sourceLang, const std::string& targetLang) const {
    return (fs::path(config_.getTranslationModelsPath()) / (sourceLang + "-" + targetLang)).string();
}

std::optional<MarianModelFiles> MarianModelStore::locate(const std::string& sourceLang,
                                                         const std::string& targetLang) const {
    fs::path dir(pairDirectory(sourceLang, targetLang));
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return std::nullopt;
    }

    MarianModelFiles files;
    files.directory = dir.string();

    auto model = firstExisting(dir, {"model.npz", "model.bin"});
    if (!model) {
        for (const char* extension : {".npz", ".bin"}) {
            for (const auto& candidate : filesWithExtension(dir, extension)) {
                if (!looksLikeAuxiliaryFile(candidate)) {
                    model = candidate.string();
                    break;
                }
            }
            if (model) {
                break;
            }
        }
    }
    if (!model) {
        return std::nullopt;
    }
    files.modelFile = *model;

    auto sourceVocab = firstExisting(dir, {"source.spm", "vocab.src.spm"});
    auto targetVocab = firstExisting(dir, {"target.spm", "vocab.trg.spm"});
    if (sourceVocab && targetVocab) {
        files.vocabs = {*sourceVocab, *targetVocab};
        return files;
    }

    auto shared = firstExisting(dir, {"vocab.yml", "vocab.spm", "vocab.json"});
    if (!shared) {
        auto spm = filesWithExtension(dir, ".spm");
        if (!spm.empty()) {
            shared = spm.front().string();
        }
    }
    if (!shared) {
        return std::nullopt;
    }
    files.vocabs = {*shared, *shared};
    return files;
}

std::vector<std::string> MarianModelStore::buildArguments(const MarianModelFiles& files) const {
    const unsigned threads = std::max(1u, std::thread::hardware_concurrency());
    std::vector<std::string> args = {
        "soksak-marian",
        "-m", files.modelFile,
        "-v", files.vocabs.at(0), files.vocabs.at(1),
        "--beam-size", std::to_string(config_.getTranslationBeamSize()),
        "--cpu-threads", std::to_string(threads),
        "--mini-batch", "1",
        "--maxi-batch", "1",
        "--quiet",
        "--quiet-translation"
    };
    return args;
}

std::shared_ptr<LoadedMarianModel> MarianModelStore::acquire(const std::string& sourceLang,
                                                             const std::string& targetLang) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto key = std::make_pair(sourceLang, targetLang);
    auto it = loaded_.find(key);
    if (it != loaded_.end()) {
        return it->second;
    }

    auto files = locate(sourceLang, targetLang);
    if (!files) {
        throw utils::LanguageResourceNotInstalledException(sourceLang, targetLang,
                                                           pairDirectory(sourceLang, targetLang));
    }

    std::vector<std::string> args = buildArguments(*files);
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(&arg[0]);
    }
    argv.push_back(nullptr);

    auto model = std::make_shared<LoadedMarianModel>();
    try {
        auto options = marian::parseOptions(static_cast<int>(args.size()), argv.data(),
                                             marian::cli::mode::translation, true);
        model->service = marian::New<marian::TranslateService<marian::BeamSearch>>(options);
    } catch (const std::exception& e) {
        throw utils::TranslationException("Failed to load Marian model from " + files->directory +
                                          ": " + e.what(), "MarianModelStore");
    }

    utils::Logger::info("Marian model loaded for " + sourceLang + " -> " + targetLang +
                        " from " + files->directory);
    loaded_.emplace(key, model);
    return model;
}

// MarianTranslator

MarianTranslator::MarianTranslator(std::string sourceLang, std::string targetLang,
                                   std::shared_ptr<MarianModelStore> store)
    : sourceLang_(std::move(sourceLang))
    , targetLang_(std::move(targetLang))
    , store_(std::move(store)) {
}

void MarianTranslator::prepare() {
    if (!isValidLanguageCode(sourceLang_) || !isValidLanguageCode(targetLang_)) {
        throw utils::TranslationException("Invalid language code: " + sourceLang_ + " -> " + targetLang_,
                                          "MarianTranslator");
    }
    model_ = store_->acquire(sourceLang_, targetLang_);
}

std::string MarianTranslator::translate(const std::string& text) {
    if (!model_) {
        throw utils::TranslationException("Translation session used before prepare()", "MarianTranslator");
    }

    bool blank = std::all_of(text.begin(), text.end(),
                             [](char c) { return std::isspace(static_cast<unsigned char>(c)); });
    if (blank) {
        return std::string();
    }

    std::string output;
    try {
        std::lock_guard<std::mutex> lock(model_->mutex);
        output = model_->service->run(text);
    } catch (const std::exception& e) {
        throw utils::TranslationException(std::string("Marian translation failed: ") + e.what(),
                                          "MarianTranslator");
    }
    return trimTrailingWhitespace(output);
}

// MarianTranslatorFactory

MarianTranslatorFactory::MarianTranslatorFactory(const utils::Config& config)
    : store_(std::make_shared<MarianModelStore>(config)) {
}

std::unique_ptr<TranslationSession> MarianTranslatorFactory::createSession(const std::string& sourceLang,
                                                                           const std::string& targetLang) {
    return std::make_unique<MarianTranslator>(sourceLang, targetLang, store_);
}

} // namespace mt
} // namespace soksak
