#ifndef PATHLINK_ENGINE_COMMANDS_H
#define PATHLINK_ENGINE_COMMANDS_H

#include "pathlink/core/types.h"
#include <cstdint>
#include <cstddef>

namespace pathlink {

using CommandCallback = EngineError(*)(void* ctx, std::uint32_t op, const std::uint8_t* payload, std::uint32_t payloadByteCount);

// Parse a layout command buffer and invoke the callback for each command.
// Returns EngineError::Ok on success, or the first error encountered
// (including one returned by the callback).
EngineError parseCommandBuffer(const std::uint8_t* src, std::uint32_t byteCount, CommandCallback cb, void* ctx);

}

#endif // PATHLINK_ENGINE_COMMANDS_H
