#include "pathlink/command/commands.h"
#include "pathlink/core/util.h"
#include "pathlink/core/types.h"

namespace pathlink {

EngineError parseCommandBuffer(const std::uint8_t* src, std::uint32_t byteCount, CommandCallback cb, void* ctx) {
    if (!src || byteCount < commandHeaderBytes) {
        return EngineError::BufferTruncated;
    }

    const std::uint32_t magic = readU32(src, 0);
    if (magic != layoutCommandMagicPllc) {
        return EngineError::InvalidMagic;
    }
    const std::uint32_t version = readU32(src, 4);
    if (version != layoutCommandVersion) {
        return EngineError::UnsupportedVersion;
    }
    const std::uint32_t commandCount = readU32(src, 8);

    std::size_t o = commandHeaderBytes;
    for (std::uint32_t i = 0; i < commandCount; i++) {
        if (o > byteCount || perCommandHeaderBytes > (byteCount - o)) {
            return EngineError::BufferTruncated;
        }
        const std::uint32_t op = readU32(src, o); o += 4;
        o += 4; // reserved
        const std::uint32_t payloadByteCount = readU32(src, o); o += 4;
        o += 4; // reserved

        if (payloadByteCount > (byteCount - o)) {
            return EngineError::BufferTruncated;
        }

        const std::uint8_t* payload = src + o;
        if (cb) {
            const EngineError err = cb(ctx, op, payload, payloadByteCount);
            if (err != EngineError::Ok) {
                return err;
            }
        }

        o += payloadByteCount;
    }

    return EngineError::Ok;
}

} // namespace pathlink
