// TemplateEngine event system methods

#include "doclayout/engine.h"
#include "doclayout/internal/engine_state.h"
#include "doclayout/core/string_utils.h"

#include <algorithm>

namespace {

std::uint32_t keyHash(const std::string& key) {
    const std::uint64_t h = doclayout::hashString(doclayout::kDigestOffset, key);
    return static_cast<std::uint32_t>(h & 0xFFFFFFFFu);
}

std::uint32_t sectionSlot(const SectionStore& store, const std::string& sectionId) {
    const std::int32_t idx = store.sectionIndex(sectionId);
    return idx < 0 ? 0xFFFFFFFFu : static_cast<std::uint32_t>(idx);
}

// Section order first, then key.
std::vector<FieldRef> sortedRefs(const SectionStore& store, std::vector<FieldRef> refs) {
    std::sort(refs.begin(), refs.end(), [&](const FieldRef& a, const FieldRef& b) {
        const std::uint32_t sa = sectionSlot(store, a.sectionId);
        const std::uint32_t sb = sectionSlot(store, b.sectionId);
        if (sa != sb) return sa < sb;
        if (a.sectionId != b.sectionId) return a.sectionId < b.sectionId;
        return a.fieldId < b.fieldId;
    });
    return refs;
}

void resetPending(EngineState& s) {
    s.pendingFieldChanges_.clear();
    s.pendingFieldCreates_.clear();
    s.pendingFieldDeletes_.clear();
    s.pendingDocMask_ = 0;
    s.pendingSelectionChanged_ = false;
    s.pendingGroupsChanged_ = false;
    s.pendingClipboardChanged_ = false;
}

} // namespace

void TemplateEngine::clearEventState() {
    EngineState& s = state();
    s.eventHead_ = 0;
    s.eventTail_ = 0;
    s.eventCount_ = 0;
    s.eventOverflowed_ = false;
    s.eventOverflowGeneration_ = 0;
    resetPending(s);
}

void TemplateEngine::recordDocChanged(std::uint32_t mask) {
    EngineState& s = state();
    if (s.eventOverflowed_) return;
    s.pendingDocMask_ |= mask;
}

void TemplateEngine::recordFieldChanged(const FieldRef& ref, std::uint32_t mask) {
    EngineState& s = state();
    if (s.eventOverflowed_) return;
    if (s.pendingFieldDeletes_.find(ref) != s.pendingFieldDeletes_.end()) return;
    s.pendingFieldChanges_[ref] |= mask;
    recordDocChanged(mask);
}

void TemplateEngine::recordFieldCreated(const FieldRef& ref) {
    EngineState& s = state();
    if (s.eventOverflowed_) return;
    s.pendingFieldDeletes_.erase(ref);
    s.pendingFieldChanges_.erase(ref);
    s.pendingFieldCreates_.insert(ref);
    recordDocChanged(
        static_cast<std::uint32_t>(ChangeMask::Geometry)
        | static_cast<std::uint32_t>(ChangeMask::Style)
        | static_cast<std::uint32_t>(ChangeMask::Structure));
}

void TemplateEngine::recordFieldDeleted(const FieldRef& ref) {
    EngineState& s = state();
    if (s.eventOverflowed_) return;
    s.pendingFieldDeletes_.insert(ref);
    s.pendingFieldChanges_.erase(ref);
    s.pendingFieldCreates_.erase(ref);
    recordDocChanged(
        static_cast<std::uint32_t>(ChangeMask::Geometry)
        | static_cast<std::uint32_t>(ChangeMask::Structure));
}

void TemplateEngine::recordSelectionChanged() {
    if (state().eventOverflowed_) return;
    state().pendingSelectionChanged_ = true;
}

void TemplateEngine::recordGroupsChanged() {
    if (state().eventOverflowed_) return;
    state().pendingGroupsChanged_ = true;
}

void TemplateEngine::recordClipboardChanged() {
    if (state().eventOverflowed_) return;
    state().pendingClipboardChanged_ = true;
}

bool TemplateEngine::pushEvent(const EngineEvent& ev) {
    EngineState& s = state();
    if (s.eventOverflowed_) return false;
    if (s.eventCount_ >= EngineState::kMaxEvents) {
        s.eventOverflowed_ = true;
        s.eventOverflowGeneration_ = s.generation;
        s.eventHead_ = 0;
        s.eventTail_ = 0;
        s.eventCount_ = 0;
        return false;
    }
    s.eventQueue_[s.eventTail_] = ev;
    s.eventTail_ = (s.eventTail_ + 1) % EngineState::kMaxEvents;
    s.eventCount_++;
    return true;
}

void TemplateEngine::flushPendingEvents() {
    EngineState& s = state();
    if (s.eventOverflowed_) {
        resetPending(s);
        return;
    }

    if (s.pendingDocMask_ == 0 &&
        s.pendingFieldChanges_.empty() &&
        s.pendingFieldCreates_.empty() &&
        s.pendingFieldDeletes_.empty() &&
        !s.pendingSelectionChanged_ &&
        !s.pendingGroupsChanged_ &&
        !s.pendingClipboardChanged_) {
        return;
    }

    auto pushOrOverflow = [&](const EngineEvent& ev) -> bool {
        if (!pushEvent(ev)) {
            resetPending(s);
            return false;
        }
        return true;
    };

    if (s.pendingDocMask_ != 0) {
        if (!pushOrOverflow(EngineEvent{
                static_cast<std::uint16_t>(EventType::DocChanged),
                0,
                s.pendingDocMask_,
                0,
                0,
            })) {
            return;
        }
    }

    if (!s.pendingFieldCreates_.empty()) {
        const std::vector<FieldRef> refs = sortedRefs(
            s.store, std::vector<FieldRef>(s.pendingFieldCreates_.begin(), s.pendingFieldCreates_.end()));
        for (const auto& ref : refs) {
            if (!pushOrOverflow(EngineEvent{
                    static_cast<std::uint16_t>(EventType::FieldCreated),
                    0,
                    sectionSlot(s.store, ref.sectionId),
                    keyHash(ref.fieldId),
                    0,
                })) {
                return;
            }
        }
    }

    if (!s.pendingFieldChanges_.empty()) {
        std::vector<FieldRef> refs;
        refs.reserve(s.pendingFieldChanges_.size());
        for (const auto& kv : s.pendingFieldChanges_) refs.push_back(kv.first);
        refs = sortedRefs(s.store, std::move(refs));
        for (const auto& ref : refs) {
            if (!pushOrOverflow(EngineEvent{
                    static_cast<std::uint16_t>(EventType::FieldChanged),
                    0,
                    sectionSlot(s.store, ref.sectionId),
                    keyHash(ref.fieldId),
                    s.pendingFieldChanges_[ref],
                })) {
                return;
            }
        }
    }

    if (!s.pendingFieldDeletes_.empty()) {
        const std::vector<FieldRef> refs = sortedRefs(
            s.store, std::vector<FieldRef>(s.pendingFieldDeletes_.begin(), s.pendingFieldDeletes_.end()));
        for (const auto& ref : refs) {
            if (!pushOrOverflow(EngineEvent{
                    static_cast<std::uint16_t>(EventType::FieldDeleted),
                    0,
                    sectionSlot(s.store, ref.sectionId),
                    keyHash(ref.fieldId),
                    0,
                })) {
                return;
            }
        }
    }

    if (s.pendingSelectionChanged_) {
        if (!pushOrOverflow(EngineEvent{
                static_cast<std::uint16_t>(EventType::SelectionChanged),
                0,
                s.selection.getGeneration(),
                static_cast<std::uint32_t>(s.selection.size()),
                0,
            })) {
            return;
        }
    }

    if (s.pendingGroupsChanged_) {
        if (!pushOrOverflow(EngineEvent{
                static_cast<std::uint16_t>(EventType::GroupsChanged),
                0,
                s.generation,
                static_cast<std::uint32_t>(s.groups.groupCount()),
                0,
            })) {
            return;
        }
    }

    if (s.pendingClipboardChanged_) {
        if (!pushOrOverflow(EngineEvent{
                static_cast<std::uint16_t>(EventType::ClipboardChanged),
                0,
                s.generation,
                static_cast<std::uint32_t>(s.clipboard.entries().size()),
                0,
            })) {
            return;
        }
    }

    resetPending(s);
}

TemplateEngine::EventBufferMeta TemplateEngine::pollEvents(std::uint32_t maxEvents) {
    flushPendingEvents();

    EngineState& s = state();
    s.eventBuffer_.clear();
    if (s.eventOverflowed_) {
        s.eventBuffer_.push_back(EngineEvent{
            static_cast<std::uint16_t>(EventType::Overflow),
            0,
            s.eventOverflowGeneration_,
            0,
            0,
        });
        return EventBufferMeta{
            s.generation,
            static_cast<std::uint32_t>(s.eventBuffer_.size()),
            reinterpret_cast<std::uintptr_t>(s.eventBuffer_.data()),
        };
    }

    if (s.eventCount_ == 0 || maxEvents == 0) {
        return EventBufferMeta{s.generation, 0, 0};
    }

    const std::size_t count = std::min<std::size_t>(maxEvents, s.eventCount_);
    s.eventBuffer_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        s.eventBuffer_.push_back(s.eventQueue_[s.eventHead_]);
        s.eventHead_ = (s.eventHead_ + 1) % EngineState::kMaxEvents;
        s.eventCount_--;
    }

    return EventBufferMeta{
        s.generation,
        static_cast<std::uint32_t>(s.eventBuffer_.size()),
        reinterpret_cast<std::uintptr_t>(s.eventBuffer_.data()),
    };
}

void TemplateEngine::ackResync(std::uint32_t resyncGeneration) {
    EngineState& s = state();
    if (!s.eventOverflowed_) return;
    if (resyncGeneration < s.eventOverflowGeneration_) return;
    s.eventOverflowed_ = false;
    s.eventOverflowGeneration_ = 0;
    s.eventHead_ = 0;
    s.eventTail_ = 0;
    s.eventCount_ = 0;
    resetPending(s);
}
