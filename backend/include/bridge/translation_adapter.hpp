#pragma once

#include "bridge/bridge_service.hpp"
#include "bridge/callback_dispatch.hpp"
#include "bridge/soksak_bridge.h"

#include <string>

namespace soksak {
namespace bridge {

class TranslationAdapter {
public:
    /**
     * Resolve the source language and schedule the translation. If the
     * source must be detected and cannot be, resultCallback fails on the
     * calling thread and nothing is scheduled.
     */
    static void start(const char* text,
                      const char* sourceLang,
                      const char* targetLang,
                      void* userData,
                      soksak_translate_result_callback resultCallback);

    /**
     * Create, prepare and run a session for the pair, delivering the result
     * to sink. Throws on failure.
     */
    static void run(const std::string& text,
                    const std::string& sourceLang,
                    const std::string& targetLang,
                    const Backends& backends,
                    TranslationSink& sink);
};

} // namespace bridge
} // namespace soksak
