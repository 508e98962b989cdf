#ifndef DOCLAYOUT_COMMAND_COMMANDS_H
#define DOCLAYOUT_COMMAND_COMMANDS_H

#include "doclayout/core/types.h"
#include <cstdint>
#include <cstddef>

namespace doclayout {

using CommandCallback = EngineError(*)(void* ctx, std::uint32_t op, const std::uint8_t* payload, std::uint32_t payloadByteCount);

// Parse a DLCB command buffer and invoke the callback for each command.
// Stops at the first command whose callback fails and returns that error.
EngineError parseCommandBuffer(const std::uint8_t* src, std::uint32_t byteCount, CommandCallback cb, void* ctx);

} // namespace doclayout

#endif // DOCLAYOUT_COMMAND_COMMANDS_H
