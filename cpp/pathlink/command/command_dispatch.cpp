#include "pathlink/command/command_dispatch.h"

#include <cmath>
#include <cstring>
#include <string>
#include <utility>

namespace pathlink {

namespace {

bool isFiniteRect(const TargetPayloadHeader& p) {
    return std::isfinite(p.x) && std::isfinite(p.y)
        && std::isfinite(p.w) && std::isfinite(p.h)
        && p.w >= 0.0f && p.h >= 0.0f;
}

} // namespace

EngineError dispatchLayoutCommand(
    PendingLayout& layout,
    std::uint32_t op,
    const std::uint8_t* payload,
    std::uint32_t payloadByteCount
) {
    switch (op) {
        case static_cast<std::uint32_t>(LayoutCommandOp::ClearTargets): {
            if (payloadByteCount != 0) return EngineError::InvalidPayloadSize;
            layout.targets.clear();
            break;
        }
        case static_cast<std::uint32_t>(LayoutCommandOp::UpsertTarget): {
            if (payloadByteCount < sizeof(TargetPayloadHeader)) return EngineError::InvalidPayloadSize;
            TargetPayloadHeader hdr;
            std::memcpy(&hdr, payload, sizeof(TargetPayloadHeader));
            const std::size_t expected = sizeof(TargetPayloadHeader) + static_cast<std::size_t>(hdr.idByteCount);
            if (expected != payloadByteCount) return EngineError::InvalidPayloadSize;
            if (hdr.idByteCount == 0) return EngineError::InvalidPayload;
            if (!isValidCategory(hdr.category)) return EngineError::InvalidPayload;
            if (!isFiniteRect(hdr)) return EngineError::InvalidPayload;

            TargetRec rec;
            rec.id.assign(reinterpret_cast<const char*>(payload + sizeof(TargetPayloadHeader)), hdr.idByteCount);
            rec.category = static_cast<Category>(hdr.category);
            rec.bounds = RectF{hdr.x, hdr.y, hdr.w, hdr.h};

            bool replaced = false;
            for (auto& existing : layout.targets) {
                if (existing.id == rec.id) {
                    existing = rec;
                    replaced = true;
                    break;
                }
            }
            if (!replaced) {
                layout.targets.push_back(std::move(rec));
            }
            break;
        }
        case static_cast<std::uint32_t>(LayoutCommandOp::SetCanvasSize): {
            if (payloadByteCount != sizeof(CanvasSizePayload)) return EngineError::InvalidPayloadSize;
            CanvasSizePayload p;
            std::memcpy(&p, payload, sizeof(CanvasSizePayload));
            if (!std::isfinite(p.width) || !std::isfinite(p.height)) return EngineError::InvalidPayload;
            layout.canvasChanged = true;
            layout.canvasWidth = p.width;
            layout.canvasHeight = p.height;
            break;
        }
        default:
            return EngineError::UnknownCommand;
    }
    return EngineError::Ok;
}

} // namespace pathlink
