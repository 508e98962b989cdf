#ifndef DOCLAYOUT_CORE_TYPES_H
#define DOCLAYOUT_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

// Data model and constants shared by the template layout engine.

// Snapshot/command format constants
static constexpr std::uint32_t snapshotMagicTsnp = 0x504E5354; // "TSNP"
static constexpr std::uint32_t snapshotVersionTsnp = 1;
static constexpr std::uint32_t commandMagicDlcb = 0x42434C44; // "DLCB"
static constexpr std::uint32_t commandVersionDlcb = 1;
static constexpr std::size_t snapshotHeaderBytesTsnp = 4 * 4; // magic + version + sectionCount + reserved
static constexpr std::size_t snapshotSectionEntryBytes = 4 * 4; // tag + offset + size + crc32
static constexpr std::size_t commandHeaderBytes = 4 * 4;
static constexpr std::size_t perCommandHeaderBytes = 4 * 4;

enum class Alignment : std::uint8_t {
    Left   = 0,
    Center = 1,
    Right  = 2,
};

enum class FieldType : std::uint8_t {
    Text   = 0,
    Line   = 1,
    Box    = 2,
    Micr   = 3,
    Static = 4,
    Image  = 5,
    Table  = 6,
};

enum class LineStyle : std::uint8_t {
    Solid  = 0,
    Dashed = 1,
    Dotted = 2,
};

// Placement and styling of one field. x/y are section-local points, top-left origin.
struct Geometry {
    float x{0.0f};
    float y{0.0f};
    float width{100.0f};
    float height{30.0f};
    float fontSize{12.0f};
    std::string fontFamily{"Helvetica"};
    Alignment alignment{Alignment::Left};
    std::optional<std::string> format;
    std::optional<FieldType> fieldType;
    std::optional<float> lineWidth;
    std::optional<std::string> lineColor;
    std::optional<LineStyle> lineStyle;
    std::optional<std::string> textContent;
};

inline bool operator==(const Geometry& a, const Geometry& b) {
    return a.x == b.x && a.y == b.y && a.width == b.width && a.height == b.height
        && a.fontSize == b.fontSize && a.fontFamily == b.fontFamily && a.alignment == b.alignment
        && a.format == b.format && a.fieldType == b.fieldType && a.lineWidth == b.lineWidth
        && a.lineColor == b.lineColor && a.lineStyle == b.lineStyle && a.textContent == b.textContent;
}
inline bool operator!=(const Geometry& a, const Geometry& b) { return !(a == b); }

// Partial update applied to every selected field by the properties panel.
struct GeometryPatch {
    std::optional<float> x;
    std::optional<float> y;
    std::optional<float> width;
    std::optional<float> height;
    std::optional<float> fontSize;
    std::optional<std::string> fontFamily;
    std::optional<Alignment> alignment;
    std::optional<std::string> format;
    std::optional<FieldType> fieldType;
    std::optional<float> lineWidth;
    std::optional<std::string> lineColor;
    std::optional<LineStyle> lineStyle;
    std::optional<std::string> textContent;

    void applyTo(Geometry& g) const {
        if (x) g.x = *x;
        if (y) g.y = *y;
        if (width) g.width = *width;
        if (height) g.height = *height;
        if (fontSize) g.fontSize = *fontSize;
        if (fontFamily) g.fontFamily = *fontFamily;
        if (alignment) g.alignment = *alignment;
        if (format) g.format = format;
        if (fieldType) g.fieldType = fieldType;
        if (lineWidth) g.lineWidth = lineWidth;
        if (lineColor) g.lineColor = lineColor;
        if (lineStyle) g.lineStyle = lineStyle;
        if (textContent) g.textContent = textContent;
    }
};

struct FieldEntry {
    std::string key;
    Geometry geometry;
};

// Fields keep insertion order; keys are unique within one section only.
struct Section {
    std::string id;
    std::string name;
    float heightInches{0.0f};
    std::vector<FieldEntry> fields;

    const Geometry* findField(const std::string& key) const {
        for (const auto& f : fields) {
            if (f.key == key) return &f.geometry;
        }
        return nullptr;
    }
    Geometry* findField(const std::string& key) {
        for (auto& f : fields) {
            if (f.key == key) return &f.geometry;
        }
        return nullptr;
    }
    bool hasField(const std::string& key) const { return findField(key) != nullptr; }
};

// A field instance addressed by (key, owning section).
struct FieldRef {
    std::string fieldId;
    std::string sectionId;
};

inline bool operator==(const FieldRef& a, const FieldRef& b) {
    return a.fieldId == b.fieldId && a.sectionId == b.sectionId;
}
inline bool operator!=(const FieldRef& a, const FieldRef& b) { return !(a == b); }

struct FieldRefHash {
    std::size_t operator()(const FieldRef& ref) const noexcept {
        const std::size_t h1 = std::hash<std::string>{}(ref.fieldId);
        const std::size_t h2 = std::hash<std::string>{}(ref.sectionId);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ull + (h1 << 6) + (h1 >> 2));
    }
};

// Opaque to the engine apart from the active-section check on hydrate.
struct UiPreferences {
    float zoom{0.8f};
    bool showGrid{true};
    bool snapToGrid{true};
    std::optional<std::string> activeSectionId;
};

struct Template {
    std::optional<std::uint32_t> id;
    std::string documentType;
    std::string name{"New Template"};
    std::string description;
    std::vector<Section> sections;
    float pageWidth{612.0f};
    float pageHeight{792.0f};
    UiPreferences uiPreferences;
};

struct EngineConfig {
    float minFieldSize{20.0f};
    float stackSpacing{40.0f};
    float defaultFieldX{50.0f};
    float pointsPerInch{72.0f};
    float pageWidthPoints{612.0f};
    float pageHeightPoints{792.0f};
    float defaultFontSize{12.0f};
    std::string defaultFontFamily{"Helvetica"};
};

enum class EngineError : std::uint32_t {
    Ok = 0,
    NoSections = 1,
    SectionNotFound = 2,
    FieldNotFound = 3,
    NoTargets = 4,
    InsufficientSelection = 5,
    NoGroupsAffected = 6,
    EmptySelection = 7,
    EmptySection = 8,
    EmptyClipboard = 9,
    NoActiveSection = 10,
    InvalidMagic = 11,
    UnsupportedVersion = 12,
    BufferTruncated = 13,
    InvalidPayloadSize = 14,
    UnknownCommand = 15,
    InvalidOperation = 16,
    NotHydrated = 17,
    PersistenceFailed = 18,
};

inline const char* engineErrorName(EngineError err) noexcept {
    switch (err) {
        case EngineError::Ok: return "Ok";
        case EngineError::NoSections: return "NoSections";
        case EngineError::SectionNotFound: return "SectionNotFound";
        case EngineError::FieldNotFound: return "FieldNotFound";
        case EngineError::NoTargets: return "NoTargets";
        case EngineError::InsufficientSelection: return "InsufficientSelection";
        case EngineError::NoGroupsAffected: return "NoGroupsAffected";
        case EngineError::EmptySelection: return "EmptySelection";
        case EngineError::EmptySection: return "EmptySection";
        case EngineError::EmptyClipboard: return "EmptyClipboard";
        case EngineError::NoActiveSection: return "NoActiveSection";
        case EngineError::InvalidMagic: return "InvalidMagic";
        case EngineError::UnsupportedVersion: return "UnsupportedVersion";
        case EngineError::BufferTruncated: return "BufferTruncated";
        case EngineError::InvalidPayloadSize: return "InvalidPayloadSize";
        case EngineError::UnknownCommand: return "UnknownCommand";
        case EngineError::InvalidOperation: return "InvalidOperation";
        case EngineError::NotHydrated: return "NotHydrated";
        case EngineError::PersistenceFailed: return "PersistenceFailed";
    }
    return "Unknown";
}

// Command ops (DLCB v1)
enum class CommandOp : std::uint32_t {
    AddField = 1,
    MoveField = 2,
    ResizeField = 3,
    DeleteField = 4,
    DeleteSelection = 5,
    Select = 6,
    Group = 7,
    Ungroup = 8,
    Copy = 9,
    CopyAll = 10,
    Paste = 11,
    ClearSection = 12,
    ClearAll = 13,
    SetActiveSection = 14,
    UpdateSelected = 15,
};

#endif // DOCLAYOUT_CORE_TYPES_H
