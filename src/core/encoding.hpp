#pragma once

#include <cstdint>
#include <optional>

namespace braille {

constexpr uint32_t BRAILLE_BASE = 0x2800;
constexpr uint32_t BRAILLE_BLANK = BRAILLE_BASE;
constexpr int DOTS_PER_CELL_X = 2;
constexpr int DOTS_PER_CELL_Y = 4;

// Unicode Braille dot numbering: dots 1-3 and 7 run down the left column,
// dots 4-6 and 8 down the right. Dot n sets bit n-1.
constexpr uint8_t DOT_BITS[DOTS_PER_CELL_Y][DOTS_PER_CELL_X] = {
    {0x01, 0x08},
    {0x02, 0x10},
    {0x04, 0x20},
    {0x40, 0x80}
};

inline uint8_t dot_bit(int local_x, int local_y) {
    return DOT_BITS[local_y & 3][local_x & 1];
}

inline uint32_t encode_bitfield(uint8_t bits) {
    return BRAILLE_BASE + bits;
}

inline std::optional<uint8_t> decode_character(uint32_t cp) {
    if (cp < BRAILLE_BASE || cp > BRAILLE_BASE + 0xFF) return std::nullopt;
    return static_cast<uint8_t>(cp - BRAILLE_BASE);
}

inline bool is_braille_character(uint32_t cp) {
    return decode_character(cp).has_value();
}

}
