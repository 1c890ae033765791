#pragma once

#include "bridge/bridge_service.hpp"
#include "bridge/callback_dispatch.hpp"
#include "bridge/context_handle.hpp"
#include "bridge/soksak_bridge.h"

#include <memory>
#include <string>

namespace soksak {
namespace bridge {

class TranscriptionAdapter {
public:
    /**
     * Schedule a transcription and return immediately. Invalid arguments
     * are reported through resultCallback like any other failure. Without
     * a resultCallback nothing is scheduled.
     */
    static void start(std::shared_ptr<Context> context,
                      const char* audioPath,
                      soksak_transcribe_result_callback resultCallback,
                      soksak_transcribe_progress_callback progressCallback,
                      void* userData);

    /**
     * Decode audioPath and stream its segments into sink, finishing with
     * succeed(). Throws on failure; the sink is left without a terminal call.
     */
    static void run(Context& context,
                    const std::string& audioPath,
                    const Backends& backends,
                    TranscriptionSink& sink);
};

} // namespace bridge
} // namespace soksak
