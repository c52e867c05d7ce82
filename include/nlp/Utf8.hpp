#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace intentcluster {
namespace nlp {

// Decode the code point starting at text[pos].
// Returns its length in bytes, or 0 for a malformed, overlong or surrogate sequence.
inline size_t decodeUtf8(const std::string& text, size_t pos, uint32_t& cp) {
    const unsigned char lead = static_cast<unsigned char>(text[pos]);
    size_t length;
    uint32_t min;

    if (lead < 0x80) {
        cp = lead;
        return 1;
    } else if ((lead & 0xE0) == 0xC0) {
        length = 2; cp = lead & 0x1F; min = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3; cp = lead & 0x0F; min = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4; cp = lead & 0x07; min = 0x10000;
    } else {
        return 0;
    }

    if (pos + length > text.size()) return 0;
    for (size_t k = 1; k < length; ++k) {
        const unsigned char next = static_cast<unsigned char>(text[pos + k]);
        if ((next & 0xC0) != 0x80) return 0;
        cp = (cp << 6) | (next & 0x3F);
    }

    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return 0;
    return length;
}

inline bool isValidUtf8(const std::string& text) {
    uint32_t cp = 0;
    for (size_t i = 0; i < text.size();) {
        size_t length = decodeUtf8(text, i, cp);
        if (length == 0) return false;
        i += length;
    }
    return true;
}

} // namespace nlp
} // namespace intentcluster
