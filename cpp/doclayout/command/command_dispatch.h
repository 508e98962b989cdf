#pragma once

#include "doclayout/core/types.h"
#include <cstdint>

class TemplateEngine;

namespace doclayout {

/**
 * Decodes one DLCB command payload and runs it against the engine.
 * Acts as the callback for parseCommandBuffer. A payload that does not
 * decode exactly fails with InvalidPayloadSize before touching state.
 */
EngineError dispatchCommand(
    TemplateEngine* engine,
    std::uint32_t op,
    const std::uint8_t* payload,
    std::uint32_t payloadByteCount
);

} // namespace doclayout
