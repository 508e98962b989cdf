#include "doclayout/command/command_dispatch.h"
#include "doclayout/engine.h"
#include "doclayout/protocol/wire_codec.h"

namespace doclayout {

namespace {

std::optional<std::string> optionalSection(std::string id) {
    if (id.empty()) return std::nullopt;
    return id;
}

} // namespace

EngineError dispatchCommand(
    TemplateEngine* self,
    std::uint32_t op,
    const std::uint8_t* payload,
    std::uint32_t payloadByteCount
) {
    wire::PayloadReader r{payload, payloadByteCount, 0};

    switch (op) {
        case static_cast<std::uint32_t>(CommandOp::AddField): {
            std::string sectionId;
            std::string baseKey;
            std::uint32_t hasY = 0;
            float y = 0.0f;
            Geometry g;
            if (!r.str(sectionId) || !r.str(baseKey) || !r.u32(hasY) || !r.f32(y)) return EngineError::InvalidPayloadSize;
            if (!wire::readGeometry(r, g) || !r.done()) return EngineError::InvalidPayloadSize;
            if (sectionId.empty()) {
                const auto active = self->getActiveSectionId();
                if (!active) return EngineError::NoSections;
                sectionId = *active;
            }
            return self->addFieldToSection(sectionId, baseKey, g, hasY ? std::optional<float>(y) : std::nullopt);
        }
        case static_cast<std::uint32_t>(CommandOp::MoveField): {
            FieldRef ref;
            float x = 0.0f;
            float y = 0.0f;
            if (!wire::readRef(r, ref) || !r.f32(x) || !r.f32(y) || !r.done()) return EngineError::InvalidPayloadSize;
            return self->moveField(ref.fieldId, ref.sectionId, x, y);
        }
        case static_cast<std::uint32_t>(CommandOp::ResizeField): {
            FieldRef ref;
            float w = 0.0f;
            float h = 0.0f;
            std::uint32_t hasX = 0;
            float x = 0.0f;
            std::uint32_t hasY = 0;
            float y = 0.0f;
            if (!wire::readRef(r, ref) || !r.f32(w) || !r.f32(h)) return EngineError::InvalidPayloadSize;
            if (!r.u32(hasX) || !r.f32(x) || !r.u32(hasY) || !r.f32(y) || !r.done()) return EngineError::InvalidPayloadSize;
            return self->resizeField(
                ref.fieldId,
                ref.sectionId,
                w,
                h,
                hasX ? std::optional<float>(x) : std::nullopt,
                hasY ? std::optional<float>(y) : std::nullopt);
        }
        case static_cast<std::uint32_t>(CommandOp::DeleteField): {
            FieldRef ref;
            if (!wire::readRef(r, ref) || !r.done()) return EngineError::InvalidPayloadSize;
            return self->deleteField(ref.fieldId, optionalSection(ref.sectionId));
        }
        case static_cast<std::uint32_t>(CommandOp::DeleteSelection): {
            if (!r.done()) return EngineError::InvalidPayloadSize;
            return self->deleteSelection();
        }
        case static_cast<std::uint32_t>(CommandOp::Select): {
            std::uint32_t hasField = 0;
            FieldRef ref;
            std::uint32_t multi = 0;
            if (!r.u32(hasField) || !wire::readRef(r, ref) || !r.u32(multi) || !r.done()) {
                return EngineError::InvalidPayloadSize;
            }
            return self->select(hasField ? std::optional<std::string>(ref.fieldId) : std::nullopt, ref.sectionId, multi != 0);
        }
        case static_cast<std::uint32_t>(CommandOp::Group): {
            if (!r.done()) return EngineError::InvalidPayloadSize;
            return self->groupSelection();
        }
        case static_cast<std::uint32_t>(CommandOp::Ungroup): {
            if (!r.done()) return EngineError::InvalidPayloadSize;
            return self->ungroupSelection();
        }
        case static_cast<std::uint32_t>(CommandOp::Copy): {
            if (!r.done()) return EngineError::InvalidPayloadSize;
            return self->copySelection();
        }
        case static_cast<std::uint32_t>(CommandOp::CopyAll): {
            std::string sectionId;
            if (!r.str(sectionId) || !r.done()) return EngineError::InvalidPayloadSize;
            return self->copyAllFromSection(sectionId);
        }
        case static_cast<std::uint32_t>(CommandOp::Paste): {
            std::string sectionId;
            if (!r.str(sectionId) || !r.done()) return EngineError::InvalidPayloadSize;
            if (sectionId.empty()) return self->paste();
            return self->pasteInto(sectionId);
        }
        case static_cast<std::uint32_t>(CommandOp::ClearSection): {
            std::string sectionId;
            if (!r.str(sectionId) || !r.done()) return EngineError::InvalidPayloadSize;
            return self->clearSection(sectionId);
        }
        case static_cast<std::uint32_t>(CommandOp::ClearAll): {
            if (!r.done()) return EngineError::InvalidPayloadSize;
            return self->clearAllSections();
        }
        case static_cast<std::uint32_t>(CommandOp::SetActiveSection): {
            std::string sectionId;
            if (!r.str(sectionId) || !r.done()) return EngineError::InvalidPayloadSize;
            return self->setActiveSection(sectionId);
        }
        case static_cast<std::uint32_t>(CommandOp::UpdateSelected): {
            GeometryPatch patch;
            if (!wire::readPatch(r, patch) || !r.done()) return EngineError::InvalidPayloadSize;
            return self->updateSelectedFields(patch);
        }
        default:
            return EngineError::UnknownCommand;
    }
}

} // namespace doclayout
