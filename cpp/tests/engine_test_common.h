#pragma once

#include <gtest/gtest.h>
#include "doclayout/engine.h"
#include "doclayout/core/util.h"
#include "doclayout/protocol/wire_codec.h"
#include "tests/test_accessors.h"
#include <cstring>
#include <string>
#include <vector>

namespace engine_test {

inline Geometry geom(float x, float y, float w = 100.0f, float h = 30.0f) {
    Geometry g;
    g.x = x;
    g.y = y;
    g.width = w;
    g.height = h;
    return g;
}

inline Section section(const std::string& id, float heightInches) {
    return Section{id, id, heightInches, {}};
}

// Two-part cheque-like document: "top" (3.5in) and "bottom" (2in).
inline Template twoSectionTemplate() {
    Template tpl;
    tpl.documentType = "cheque";
    tpl.name = "Two sections";
    tpl.sections.push_back(section("top", 3.5f));
    tpl.sections.push_back(section("bottom", 2.0f));
    return tpl;
}

inline std::vector<std::string> keysOf(const Section& s) {
    std::vector<std::string> out;
    for (const auto& f : s.fields) out.push_back(f.key);
    return out;
}

inline const EngineEvent* eventsOf(const EventBufferMeta& meta) {
    return reinterpret_cast<const TemplateEngine::EngineEvent*>(meta.ptr);
}

// Little-endian DLCB writer.
class CommandWriter {
public:
    void add(CommandOp op, const std::vector<std::uint8_t>& payload = {}) {
        appendU32(body_, static_cast<std::uint32_t>(op));
        appendU32(body_, 0);
        appendU32(body_, static_cast<std::uint32_t>(payload.size()));
        appendU32(body_, 0);
        body_.insert(body_.end(), payload.begin(), payload.end());
        count_++;
    }

    void addRaw(std::uint32_t op, const std::vector<std::uint8_t>& payload) {
        appendU32(body_, op);
        appendU32(body_, 0);
        appendU32(body_, static_cast<std::uint32_t>(payload.size()));
        appendU32(body_, 0);
        body_.insert(body_.end(), payload.begin(), payload.end());
        count_++;
    }

    std::vector<std::uint8_t> finish(std::uint32_t magic = commandMagicDlcb, std::uint32_t version = commandVersionDlcb) const {
        std::vector<std::uint8_t> out;
        appendU32(out, magic);
        appendU32(out, version);
        appendU32(out, count_);
        appendU32(out, 0);
        out.insert(out.end(), body_.begin(), body_.end());
        return out;
    }

private:
    std::vector<std::uint8_t> body_;
    std::uint32_t count_{0};
};

} // namespace engine_test
