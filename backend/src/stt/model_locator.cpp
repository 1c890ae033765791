#include "stt/model_locator.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <mutex>
#include <vector>

namespace fs = std::filesystem;

namespace soksak {
namespace stt {

namespace {

// Serializes downloads so two handles never write the same cache file
std::mutex g_downloadMutex;

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool startsWith(const std::string& value, const std::string& prefix) {
    return value.compare(0, prefix.size(), prefix) == 0;
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

void validateModelName(const std::string& modelName) {
    if (modelName.empty()) {
        throw utils::ModelLoadingException("Model name is empty");
    }
    if (modelName.find('/') != std::string::npos || modelName.find('\\') != std::string::npos ||
        modelName.find("..") != std::string::npos) {
        throw utils::ModelLoadingException("Invalid model name", modelName);
    }
}

} // namespace

ModelLocator::ModelLocator(const utils::Config& config, std::shared_ptr<utils::FileDownloader> downloader)
    : config_(config)
    , downloader_(std::move(downloader)) {
}

std::string ModelLocator::modelFileName(const std::string& modelName) {
    if (startsWith(modelName, "ggml-") && endsWith(modelName, ".bin")) {
        return modelName;
    }
    return "ggml-" + modelName + ".bin";
}

bool ModelLocator::isVadModelFile(const std::string& fileName) {
    std::string lower = toLower(fileName);
    return lower.find("silero") != std::string::npos || lower.find("vad") != std::string::npos;
}

std::optional<std::string> ModelLocator::findModelInDirectory(const std::string& directory) {
    std::error_code ec;
    std::vector<fs::path> candidates;
    for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) {
            continue;
        }
        std::string name = it->path().filename().string();
        if (startsWith(name, "ggml-") && endsWith(name, ".bin") && !isVadModelFile(name)) {
            candidates.push_back(it->path());
        }
    }
    if (ec) {
        utils::Logger::warn("Cannot list model directory " + directory + ": " + ec.message());
    }
    if (candidates.empty()) {
        return std::nullopt;
    }
    std::sort(candidates.begin(), candidates.end());
    return candidates.front().string();
}

std::string ModelLocator::cachedModelPath(const std::string& modelName) const {
    return (fs::path(config_.getModelCacheDir()) / modelFileName(modelName)).string();
}

std::string ModelLocator::resolveModel(const ModelSource& source) {
    if (source.modelPath) {
        const std::string& path = *source.modelPath;
        std::error_code ec;
        if (fs::is_directory(path, ec)) {
            auto found = findModelInDirectory(path);
            if (!found) {
                throw utils::ModelLoadingException("No ggml model found in directory", path);
            }
            utils::Logger::debug("Using model " + *found + " from directory " + path);
            return *found;
        }
        if (fs::is_regular_file(path, ec)) {
            return path;
        }
        throw utils::ModelLoadingException("Model file not found", path);
    }

    return resolveNamedModel(source.modelName ? *source.modelName : config_.getDefaultModelName());
}

std::string ModelLocator::resolveNamedModel(const std::string& modelName) {
    validateModelName(modelName);

    std::string destination = cachedModelPath(modelName);
    std::error_code ec;
    if (fs::is_regular_file(destination, ec)) {
        return destination;
    }

    if (!config_.isDownloadAllowed()) {
        throw utils::ModelLoadingException("Model '" + modelName + "' is not cached and downloads are disabled",
                                           destination);
    }

    std::string url = config_.getModelBaseUrl() + "/" + modelFileName(modelName);
    return fetch(url, destination);
}

std::optional<std::string> ModelLocator::resolveVadModel() {
    const std::string& configured = config_.getVadModelPath();
    std::error_code ec;
    if (!configured.empty()) {
        if (fs::is_regular_file(configured, ec)) {
            return configured;
        }
        utils::Logger::warn("Configured VAD model not found: " + configured);
    }

    const std::string name = config_.getVadModelName();
    if (name.empty()) {
        return std::nullopt;
    }

    std::string destination = cachedModelPath(name);
    if (fs::is_regular_file(destination, ec)) {
        return destination;
    }
    if (!config_.isDownloadAllowed()) {
        return std::nullopt;
    }

    try {
        validateModelName(name);
        return fetch(config_.getVadModelBaseUrl() + "/" + modelFileName(name), destination);
    } catch (const utils::ModelLoadingException& e) {
        utils::Logger::warn(std::string("VAD model unavailable: ") + e.what());
        return std::nullopt;
    }
}

std::string ModelLocator::fetch(const std::string& url, const std::string& destination) {
    if (!downloader_) {
        throw utils::ModelLoadingException("No downloader available for " + url, destination);
    }

    std::lock_guard<std::mutex> lock(g_downloadMutex);
    std::error_code ec;
    if (fs::is_regular_file(destination, ec)) {
        return destination;
    }

    try {
        downloader_->download(url, destination);
    } catch (const std::runtime_error& e) {
        throw utils::ModelLoadingException("Failed to download model", e.what());
    }

    if (!fs::is_regular_file(destination, ec)) {
        throw utils::ModelLoadingException("Download produced no file", destination);
    }
    return destination;
}

} // namespace stt
} // namespace soksak
