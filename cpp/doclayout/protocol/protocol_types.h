#pragma once

#include <cstdint>

// =============================================================================
// Event Stream Types
// =============================================================================

enum class EventType : std::uint16_t {
    Overflow = 1,
    DocChanged = 2,
    FieldChanged = 3,
    FieldCreated = 4,
    FieldDeleted = 5,
    SelectionChanged = 6,
    GroupsChanged = 7,
    ClipboardChanged = 8,
};

enum class ChangeMask : std::uint32_t {
    Geometry = 1 << 0,
    Style = 1 << 1,
    Structure = 1 << 2,
    Preferences = 1 << 3,
    Meta = 1 << 4,
};

// Field events: a = section index, b = key hash, c = change mask.
// Selection/group/clipboard events: a = generation, b = item count.
// DocChanged: a = accumulated mask. Overflow: a = generation at overflow.
struct EngineEvent {
    std::uint16_t type;
    std::uint16_t flags;
    std::uint32_t a;
    std::uint32_t b;
    std::uint32_t c;
};

struct EventBufferMeta {
    std::uint32_t generation;
    std::uint32_t count;
    std::uintptr_t ptr;
};
