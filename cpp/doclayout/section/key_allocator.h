#ifndef DOCLAYOUT_SECTION_KEY_ALLOCATOR_H
#define DOCLAYOUT_SECTION_KEY_ALLOCATOR_H

#include "doclayout/core/types.h"
#include <cstdint>
#include <string>
#include <string_view>

namespace doclayout {

// A field key decoded into its semantic identity and duplicate counter.
// "date" -> {date, 0}; "date-2" -> {date, 2}.
//
// The string form stays the persisted representation. A base identity that
// itself ends in -<digits> cannot be told apart from a counter suffix, e.g.
// "line-2" always decodes as {line, 2}.
struct FieldKey {
    std::string base;
    std::uint64_t counter{0};

    std::string str() const;
};

FieldKey parseFieldKey(std::string_view key);

// Strips a trailing -<digits> suffix. The base keeps at least one character,
// so "-5" is its own base identity.
std::string baseIdentity(std::string_view key);

// Returns baseKey unchanged when no key in the section shares its base
// identity, otherwise baseKey-(max counter + 1) with the bare key counting as 0.
// When the max counter is saturated the lowest free suffix is used instead.
// The result is never an existing key in the section.
std::string allocateFieldKey(const Section& section, std::string_view baseKey);

} // namespace doclayout

#endif // DOCLAYOUT_SECTION_KEY_ALLOCATOR_H
