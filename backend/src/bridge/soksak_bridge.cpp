#include "bridge/soksak_bridge.h"
#include "bridge/bridge_service.hpp"
#include "bridge/context_handle.hpp"
#include "bridge/transcription_adapter.hpp"
#include "bridge/translation_adapter.hpp"
#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

#include <memory>
#include <new>

struct soksak_context {
    std::shared_ptr<soksak::bridge::Context> context;
};

using soksak::bridge::BridgeService;
using soksak::utils::Logger;

extern "C" {

SOKSAK_API soksak_context* soksak_create_context(const char* model_path,
                                                 const char* model_name,
                                                 const char* language) {
    try {
        BridgeService::getInstance();
        auto* handle = new soksak_context{soksak::bridge::Context::create(model_path, model_name, language)};
        Logger::debug("Context created (" + handle->context->getModelSource().describe() + ")");
        return handle;
    } catch (const std::exception& e) {
        Logger::error(std::string("Failed to create context: ") + e.what());
        return nullptr;
    }
}

SOKSAK_API void soksak_release_context(soksak_context* context) {
    delete context;
}

SOKSAK_API void soksak_transcribe(soksak_context* context,
                                  const char* audio_path,
                                  soksak_transcribe_result_callback result_callback,
                                  soksak_transcribe_progress_callback progress_callback,
                                  void* user_data) {
    try {
        std::shared_ptr<soksak::bridge::Context> shared = context ? context->context : nullptr;
        soksak::bridge::TranscriptionAdapter::start(std::move(shared), audio_path,
                                                    result_callback, progress_callback, user_data);
    } catch (const std::exception& e) {
        // Only reachable before a sink exists, e.g. allocation failure
        Logger::error(std::string("soksak_transcribe failed: ") + e.what());
    }
}

SOKSAK_API void soksak_translate(const char* text,
                                 const char* source_lang,
                                 const char* target_lang,
                                 void* user_data,
                                 soksak_translate_result_callback result_callback) {
    try {
        soksak::bridge::TranslationAdapter::start(text, source_lang, target_lang, user_data, result_callback);
    } catch (const std::exception& e) {
        Logger::error(std::string("soksak_translate failed: ") + e.what());
    }
}

SOKSAK_API int soksak_configure(const char* config_path) {
    if (!config_path || *config_path == '\0') {
        Logger::error("soksak_configure called without a path");
        return -1;
    }
    try {
        soksak::utils::Config config = soksak::utils::Config::load(config_path);
        config.applyEnvironmentOverrides();
        BridgeService::getInstance().configure(config);
        return 0;
    } catch (const std::exception& e) {
        soksak::utils::ErrorHandler::getInstance().reportError(e, "soksak_configure");
        return -1;
    }
}

SOKSAK_API const char* soksak_version(void) {
    return SOKSAK_BRIDGE_VERSION;
}

} // extern "C"
