#include "doclayout/section/key_allocator.h"
#include "doclayout/core/string_utils.h"

namespace doclayout {

std::string FieldKey::str() const {
    if (counter == 0) return base;
    return base + "-" + std::to_string(counter);
}

FieldKey parseFieldKey(std::string_view key) {
    std::size_t digitsBegin = key.size();
    while (digitsBegin > 0 && isAsciiDigit(key[digitsBegin - 1])) {
        --digitsBegin;
    }

    const bool hasDigits = digitsBegin < key.size();
    // The dash must leave a non-empty base in front of it.
    if (!hasDigits || digitsBegin < 2 || key[digitsBegin - 1] != '-') {
        return FieldKey{std::string(key), 0};
    }

    FieldKey out;
    out.base = std::string(key.substr(0, digitsBegin - 1));
    out.counter = parseDecimalSaturating(key.substr(digitsBegin));
    return out;
}

std::string baseIdentity(std::string_view key) {
    return parseFieldKey(key).base;
}

std::string allocateFieldKey(const Section& section, std::string_view baseKey) {
    constexpr std::uint64_t kMaxCounter = ~static_cast<std::uint64_t>(0);
    bool collides = false;
    std::uint64_t maxCounter = 0;
    for (const auto& entry : section.fields) {
        const FieldKey parsed = parseFieldKey(entry.key);
        if (parsed.base != baseKey) continue;
        collides = true;
        if (parsed.counter > maxCounter) maxCounter = parsed.counter;
    }

    std::string candidate(baseKey);
    std::uint64_t next = 1;
    if (collides) {
        // A saturated counter cannot be incremented; fall back to the lowest free suffix.
        next = maxCounter == kMaxCounter ? 1 : maxCounter + 1;
        candidate = std::string(baseKey) + "-" + std::to_string(next++);
    }

    // A base that already ends in -<digits> decodes to a different identity,
    // so the scan above cannot see an existing key with the same spelling.
    while (section.hasField(candidate)) {
        candidate = std::string(baseKey) + "-" + std::to_string(next++);
    }
    return candidate;
}

} // namespace doclayout
