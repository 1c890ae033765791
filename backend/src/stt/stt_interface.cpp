#include "stt/stt_interface.hpp"

namespace soksak {
namespace stt {

DecodeOptions DecodeOptions::bridgeDefaults(const std::optional<std::string>& language) {
    DecodeOptions options;
    options.language = language;
    options.concurrentWorkerCount = 0;
    options.chunking = ChunkingStrategy::VAD;
    options.suppressBlank = true;
    options.skipSpecialTokens = true;
    options.temperature = 0.0f;
    options.temperatureFallbackCount = 0;
    return options;
}

std::string ModelSource::describe() const {
    if (modelPath) {
        return "path:" + *modelPath;
    }
    if (modelName) {
        return "name:" + *modelName;
    }
    return "default";
}

} // namespace stt
} // namespace soksak
