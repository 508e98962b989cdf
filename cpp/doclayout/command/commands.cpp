#include "doclayout/command/commands.h"
#include "doclayout/core/util.h"
#include "doclayout/core/types.h"

namespace doclayout {

EngineError parseCommandBuffer(const std::uint8_t* src, std::uint32_t byteCount, CommandCallback cb, void* ctx) {
    if (!src || byteCount < commandHeaderBytes) {
        return EngineError::BufferTruncated;
    }

    const std::uint32_t magic = readU32(src, 0);
    if (magic != commandMagicDlcb) {
        return EngineError::InvalidMagic;
    }
    const std::uint32_t version = readU32(src, 4);
    if (version != commandVersionDlcb) {
        return EngineError::UnsupportedVersion;
    }
    const std::uint32_t commandCount = readU32(src, 8);

    std::size_t o = commandHeaderBytes;
    for (std::uint32_t i = 0; i < commandCount; i++) {
        if (o + perCommandHeaderBytes > byteCount) {
            return EngineError::BufferTruncated;
        }
        const std::uint32_t op = readU32(src, o); o += 4;
        o += 4; // reserved
        const std::uint32_t payloadByteCount = readU32(src, o); o += 4;
        o += 4; // reserved

        if (payloadByteCount > byteCount - o) {
            return EngineError::BufferTruncated;
        }

        const std::uint8_t* payload = src + o;
        if (cb) {
            const EngineError err = cb(ctx, op, payload, payloadByteCount);
            if (err != EngineError::Ok) return err;
        }

        o += payloadByteCount;
    }
    return EngineError::Ok;
}

} // namespace doclayout
