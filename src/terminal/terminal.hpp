#pragma once

#include "core/types.hpp"
#include "render/output_sink.hpp"
#include <cstdio>
#include <string>

namespace braille {

enum class ColorMode {
    None,
    Ansi16,
    Ansi256,
    Truecolor
};

const char* color_mode_name(ColorMode mode);
bool parse_color_mode(const std::string& name, ColorMode& out);

struct TerminalInfo {
    int cols = 80;
    int rows = 24;
};

// ANSI terminal sink. Output accumulates in memory and reaches the stream
// only on flush(), so one frame costs one write.
class Terminal : public OutputSink {
public:
    explicit Terminal(ColorMode color_mode = ColorMode::Truecolor, FILE* stream = stdout);
    ~Terminal() override;

    Terminal(const Terminal&) = delete;
    Terminal& operator=(const Terminal&) = delete;

    TerminalInfo get_info() const;
    Size get_size() const;

    ColorMode color_mode() const { return color_mode_; }

    Result enter_alt_screen();
    Result exit_alt_screen();
    Result hide_cursor();
    Result show_cursor();
    Result restore();

    Result write(const std::string& text) override;
    Result write_char(uint32_t codepoint) override;
    Result move_cursor(int row, int col) override;
    Result set_foreground(const Color& color) override;
    Result reset_colors() override;
    Result clear_screen() override;
    Result flush() override;

    const std::string& pending() const { return out_buffer_; }
    size_t bytes_written() const { return bytes_written_; }

    static std::string color_code(ColorMode mode, uint8_t r, uint8_t g, uint8_t b, bool fg);
    static uint8_t rgb_to_256(uint8_t r, uint8_t g, uint8_t b);
    static uint8_t rgb_to_16(uint8_t r, uint8_t g, uint8_t b);

private:
    FILE* stream_;
    ColorMode color_mode_;
    std::string out_buffer_;
    size_t bytes_written_ = 0;
    bool in_alt_screen_ = false;
    bool cursor_hidden_ = false;

    void append_cursor_move(int row, int col);
};

}
