#pragma once

#include "stt/stt_interface.hpp"
#include "utils/config.hpp"
#include "utils/http_download.hpp"

#include <memory>
#include <optional>
#include <string>

namespace soksak {
namespace stt {

/**
 * Turns a ModelSource into a local ggml model file, downloading named
 * models into the cache directory when they are not there yet.
 */
class ModelLocator {
public:
    ModelLocator(const utils::Config& config, std::shared_ptr<utils::FileDownloader> downloader);

    /**
     * Local file for the source. A directory resolves to the first
     * ggml-*.bin inside it that is not a VAD model. Throws
     * ModelLoadingException when nothing usable can be found.
     */
    std::string resolveModel(const ModelSource& source);

    /**
     * Silero VAD model for chunked decoding, or nullopt when it is not
     * configured, not cached and cannot be downloaded.
     */
    std::optional<std::string> resolveVadModel();

    std::string cachedModelPath(const std::string& modelName) const;

    static std::string modelFileName(const std::string& modelName);
    static std::optional<std::string> findModelInDirectory(const std::string& directory);
    static bool isVadModelFile(const std::string& fileName);

private:
    std::string resolveNamedModel(const std::string& modelName);
    std::string fetch(const std::string& url, const std::string& destination);

    utils::Config config_;
    std::shared_ptr<utils::FileDownloader> downloader_;
};

} // namespace stt
} // namespace soksak
