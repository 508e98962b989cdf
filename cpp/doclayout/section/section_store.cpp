#include "doclayout/section/section_store.h"
#include "doclayout/section/key_allocator.h"
#include <algorithm>
#include <utility>

SectionStore::SectionStore(const EngineConfig& config)
    : config_(config) {}

void SectionStore::clear() noexcept {
    sections_.clear();
}

void SectionStore::load(std::vector<Section> sections) {
    sections_ = std::move(sections);
}

std::size_t SectionStore::fieldCount() const noexcept {
    std::size_t n = 0;
    for (const auto& s : sections_) n += s.fields.size();
    return n;
}

Section* SectionStore::findSection(const std::string& sectionId) {
    for (auto& s : sections_) {
        if (s.id == sectionId) return &s;
    }
    return nullptr;
}

const Section* SectionStore::findSection(const std::string& sectionId) const {
    for (const auto& s : sections_) {
        if (s.id == sectionId) return &s;
    }
    return nullptr;
}

std::int32_t SectionStore::sectionIndex(const std::string& sectionId) const {
    for (std::size_t i = 0; i < sections_.size(); ++i) {
        if (sections_[i].id == sectionId) return static_cast<std::int32_t>(i);
    }
    return -1;
}

Geometry* SectionStore::findField(const FieldRef& ref) {
    Section* section = findSection(ref.sectionId);
    if (!section) return nullptr;
    return section->findField(ref.fieldId);
}

const Geometry* SectionStore::findField(const FieldRef& ref) const {
    const Section* section = findSection(ref.sectionId);
    if (!section) return nullptr;
    return section->findField(ref.fieldId);
}

const Section* SectionStore::findOwningSection(const std::string& fieldId) const {
    for (const auto& s : sections_) {
        if (s.hasField(fieldId)) return &s;
    }
    return nullptr;
}

float SectionStore::nextStackY(const Section& section) const {
    float maxY = 0.0f;
    bool any = false;
    for (const auto& f : section.fields) {
        if (!any || f.geometry.y > maxY) {
            maxY = f.geometry.y;
            any = true;
        }
    }
    return maxY + config_.stackSpacing;
}

EngineError SectionStore::addField(
    const std::string& sectionId,
    const std::string& baseKey,
    Geometry geometry,
    std::optional<float> explicitY,
    std::string& outKey
) {
    if (sections_.empty()) return EngineError::NoSections;
    Section* section = findSection(sectionId);
    if (!section) return EngineError::SectionNotFound;

    geometry.y = explicitY ? *explicitY : nextStackY(*section);
    outKey = doclayout::allocateFieldKey(*section, baseKey);
    section->fields.push_back(FieldEntry{outKey, std::move(geometry)});
    return EngineError::Ok;
}

EngineError SectionStore::setFieldPosition(const FieldRef& ref, float x, float y) {
    Geometry* g = findField(ref);
    if (!g) return EngineError::FieldNotFound;
    g->x = x;
    g->y = y;
    return EngineError::Ok;
}

EngineError SectionStore::translateField(const FieldRef& ref, float dx, float dy) {
    Geometry* g = findField(ref);
    if (!g) return EngineError::FieldNotFound;
    g->x += dx;
    g->y += dy;
    return EngineError::Ok;
}

EngineError SectionStore::resizeField(
    const FieldRef& ref,
    float width,
    float height,
    std::optional<float> x,
    std::optional<float> y
) {
    Geometry* g = findField(ref);
    if (!g) return EngineError::FieldNotFound;
    g->width = std::max(config_.minFieldSize, width);
    g->height = std::max(config_.minFieldSize, height);
    if (x) g->x = *x;
    if (y) g->y = *y;
    return EngineError::Ok;
}

EngineError SectionStore::patchField(const FieldRef& ref, const GeometryPatch& patch) {
    Geometry* g = findField(ref);
    if (!g) return EngineError::FieldNotFound;
    patch.applyTo(*g);
    return EngineError::Ok;
}

std::vector<FieldRef> SectionStore::deleteFields(const std::vector<FieldRef>& refs) {
    std::vector<FieldRef> removed;
    removed.reserve(refs.size());
    for (const auto& ref : refs) {
        Section* section = findSection(ref.sectionId);
        if (!section) continue;
        auto& fields = section->fields;
        const auto it = std::find_if(fields.begin(), fields.end(), [&](const FieldEntry& f) {
            return f.key == ref.fieldId;
        });
        if (it == fields.end()) continue;
        fields.erase(it);
        removed.push_back(ref);
    }
    return removed;
}

EngineError SectionStore::clearSection(const std::string& sectionId) {
    Section* section = findSection(sectionId);
    if (!section) return EngineError::SectionNotFound;
    section->fields.clear();
    return EngineError::Ok;
}

void SectionStore::clearAll() noexcept {
    for (auto& s : sections_) s.fields.clear();
}
