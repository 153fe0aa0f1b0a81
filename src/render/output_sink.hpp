#pragma once

#include "core/types.hpp"
#include <string>
#include <cstdint>

namespace braille {

// Rows and columns are 0-based. Implementations may buffer until flush().
class OutputSink {
public:
    virtual ~OutputSink() = default;

    virtual Result write(const std::string& text) = 0;
    virtual Result write_char(uint32_t codepoint) = 0;
    virtual Result move_cursor(int row, int col) = 0;
    virtual Result set_foreground(const Color& color) = 0;
    virtual Result reset_colors() = 0;
    // Blanks the whole screen and homes the cursor.
    virtual Result clear_screen() = 0;
    virtual Result flush() = 0;
};

}
