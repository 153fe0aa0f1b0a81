#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace braille {

namespace utf8 {

inline bool is_valid_continuation_byte(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

inline bool is_printable_scalar(uint32_t cp) {
    if (cp < 0x20 || (cp >= 0x7F && cp < 0xA0)) return false;
    if (cp >= 0xD800 && cp <= 0xDFFF) return false;
    return cp <= 0x10FFFF;
}

// Combining marks and format characters that take no terminal column.
inline bool is_zero_width(uint32_t cp) {
    return cp == 0x00AD ||
           (cp >= 0x0300 && cp <= 0x036F) ||
           (cp >= 0x0483 && cp <= 0x0489) ||
           (cp >= 0x0591 && cp <= 0x05C7) ||
           (cp >= 0x0610 && cp <= 0x061A) ||
           (cp >= 0x064B && cp <= 0x065F) ||
           (cp >= 0x200B && cp <= 0x200F) ||
           (cp >= 0x202A && cp <= 0x202E) ||
           (cp >= 0x2060 && cp <= 0x2064) ||
           (cp >= 0x20D0 && cp <= 0x20FF) ||
           (cp >= 0xFE00 && cp <= 0xFE0F) ||
           (cp >= 0xFE20 && cp <= 0xFE2F) ||
           cp == 0xFEFF;
}

inline void append(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

inline std::string encode(uint32_t cp) {
    std::string result;
    append(result, cp);
    return result;
}

// Malformed sequences and surrogates are skipped.
inline std::vector<uint32_t> to_codepoints(const std::string& s) {
    std::vector<uint32_t> result;
    size_t i = 0;
    while (i < s.size()) {
        uint32_t cp = 0;
        unsigned char c = static_cast<unsigned char>(s[i]);

        if (c < 0x80) {
            cp = c;
            ++i;
        } else if ((c & 0xE0) == 0xC0) {
            if (i + 1 >= s.size() || !is_valid_continuation_byte(s[i+1])) {
                ++i;
                continue;
            }
            cp = ((c & 0x1F) << 6) | (static_cast<unsigned char>(s[i+1]) & 0x3F);
            i += 2;
        } else if ((c & 0xF0) == 0xE0) {
            if (i + 2 >= s.size() ||
                !is_valid_continuation_byte(s[i+1]) ||
                !is_valid_continuation_byte(s[i+2])) {
                ++i;
                continue;
            }
            cp = ((c & 0x0F) << 12) |
                 ((static_cast<unsigned char>(s[i+1]) & 0x3F) << 6) |
                 (static_cast<unsigned char>(s[i+2]) & 0x3F);
            i += 3;
        } else if ((c & 0xF8) == 0xF0) {
            if (i + 3 >= s.size() ||
                !is_valid_continuation_byte(s[i+1]) ||
                !is_valid_continuation_byte(s[i+2]) ||
                !is_valid_continuation_byte(s[i+3])) {
                ++i;
                continue;
            }
            cp = ((c & 0x07) << 18) |
                 ((static_cast<unsigned char>(s[i+1]) & 0x3F) << 12) |
                 ((static_cast<unsigned char>(s[i+2]) & 0x3F) << 6) |
                 (static_cast<unsigned char>(s[i+3]) & 0x3F);
            i += 4;
        } else {
            ++i;
            continue;
        }

        if (cp >= 0xD800 && cp <= 0xDFFF) {
            continue;
        }

        result.push_back(cp);
    }
    return result;
}

}

}
