#include "terminal.hpp"
#include "core/utf8.hpp"
#include <array>
#include <cerrno>
#include <charconv>
#include <climits>
#include <cstring>
#include <system_error>

#ifdef _WIN32
#include <windows.h>
#else
#include <sys/ioctl.h>
#include <unistd.h>
#endif

namespace braille {

namespace {
    struct Color256Lookup {
        std::array<uint8_t, 256> r{};
        std::array<uint8_t, 256> g{};
        std::array<uint8_t, 256> b{};

        Color256Lookup() {
            const uint8_t palette[16][3] = {
                {0, 0, 0}, {128, 0, 0}, {0, 128, 0}, {128, 128, 0},
                {0, 0, 128}, {128, 0, 128}, {0, 128, 128}, {192, 192, 192},
                {128, 128, 128}, {255, 0, 0}, {0, 255, 0}, {255, 255, 0},
                {0, 0, 255}, {255, 0, 255}, {0, 255, 255}, {255, 255, 255}
            };

            for (int i = 0; i < 16; ++i) {
                r[i] = palette[i][0];
                g[i] = palette[i][1];
                b[i] = palette[i][2];
            }

            for (int i = 16; i < 232; ++i) {
                int idx = i - 16;
                int rv = idx / 36;
                int gv = (idx % 36) / 6;
                int bv = idx % 6;
                r[i] = rv ? static_cast<uint8_t>(55 + rv * 40) : 0;
                g[i] = gv ? static_cast<uint8_t>(55 + gv * 40) : 0;
                b[i] = bv ? static_cast<uint8_t>(55 + bv * 40) : 0;
            }

            for (int i = 232; i < 256; ++i) {
                uint8_t gray = static_cast<uint8_t>(8 + (i - 232) * 10);
                r[i] = g[i] = b[i] = gray;
            }
        }
    };

    const Color256Lookup color256_lookup;

    const char* const ESC_ALT_SCREEN_ON = "\033[?1049h";
    const char* const ESC_ALT_SCREEN_OFF = "\033[?1049l";
    const char* const ESC_CURSOR_HIDE = "\033[?25l";
    const char* const ESC_CURSOR_SHOW = "\033[?25h";
    const char* const ESC_CLEAR = "\033[2J\033[H";
    const char* const ESC_RESET = "\033[0m";
}

const char* color_mode_name(ColorMode mode) {
    switch (mode) {
        case ColorMode::None: return "none";
        case ColorMode::Ansi16: return "ansi16";
        case ColorMode::Ansi256: return "ansi256";
        case ColorMode::Truecolor: return "truecolor";
    }
    return "truecolor";
}

bool parse_color_mode(const std::string& name, ColorMode& out) {
    if (name == "none") out = ColorMode::None;
    else if (name == "16" || name == "ansi16") out = ColorMode::Ansi16;
    else if (name == "256" || name == "ansi256") out = ColorMode::Ansi256;
    else if (name == "truecolor" || name == "24bit") out = ColorMode::Truecolor;
    else return false;
    return true;
}

Terminal::Terminal(ColorMode color_mode, FILE* stream)
    : stream_(stream), color_mode_(color_mode) {
    out_buffer_.reserve(64 * 1024);
}

Terminal::~Terminal() {
    // Nothing left to report a failure to at this point.
    restore();
}

Result Terminal::restore() {
    if (in_alt_screen_ || cursor_hidden_) {
        out_buffer_ += ESC_RESET;
    }
    Result cursor = show_cursor();
    Result screen = exit_alt_screen();
    Result flushed = flush();
    if (cursor.failure()) return cursor;
    if (screen.failure()) return screen;
    return flushed;
}

TerminalInfo Terminal::get_info() const {
    TerminalInfo info;

#ifdef _WIN32
    HANDLE h_console = GetStdHandle(STD_OUTPUT_HANDLE);
    if (h_console != INVALID_HANDLE_VALUE) {
        CONSOLE_SCREEN_BUFFER_INFO csbi;
        if (GetConsoleScreenBufferInfo(h_console, &csbi)) {
            info.cols = csbi.srWindow.Right - csbi.srWindow.Left + 1;
            info.rows = csbi.srWindow.Bottom - csbi.srWindow.Top + 1;
        }
    }
#else
    winsize ws;
    const int fd = stream_ ? fileno(stream_) : STDOUT_FILENO;
    if (fd >= 0 && ioctl(fd, TIOCGWINSZ, &ws) == 0) {
        info.cols = ws.ws_col;
        info.rows = ws.ws_row;
    }
#endif

    if (info.cols <= 0) info.cols = 80;
    if (info.rows <= 0) info.rows = 24;

    return info;
}

Size Terminal::get_size() const {
    TerminalInfo info = get_info();
    return {info.cols, info.rows};
}

Result Terminal::enter_alt_screen() {
    if (in_alt_screen_) return Result::ok();
    out_buffer_ += ESC_ALT_SCREEN_ON;
    in_alt_screen_ = true;
    return flush();
}

Result Terminal::exit_alt_screen() {
    if (!in_alt_screen_) return Result::ok();
    out_buffer_ += ESC_ALT_SCREEN_OFF;
    in_alt_screen_ = false;
    return flush();
}

Result Terminal::hide_cursor() {
    if (cursor_hidden_) return Result::ok();
    out_buffer_ += ESC_CURSOR_HIDE;
    cursor_hidden_ = true;
    return flush();
}

Result Terminal::show_cursor() {
    if (!cursor_hidden_) return Result::ok();
    out_buffer_ += ESC_CURSOR_SHOW;
    cursor_hidden_ = false;
    return flush();
}

Result Terminal::clear_screen() {
    out_buffer_ += ESC_CLEAR;
    return flush();
}

Result Terminal::write(const std::string& text) {
    out_buffer_ += text;
    return Result::ok();
}

Result Terminal::write_char(uint32_t codepoint) {
    utf8::append(out_buffer_, codepoint);
    return Result::ok();
}

Result Terminal::move_cursor(int row, int col) {
    if (row < 0 || col < 0) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "cursor position must not be negative");
    }
    append_cursor_move(row + 1, col + 1);
    return Result::ok();
}

Result Terminal::set_foreground(const Color& color) {
    out_buffer_ += color_code(color_mode_, color.r, color.g, color.b, true);
    return Result::ok();
}

Result Terminal::reset_colors() {
    if (color_mode_ != ColorMode::None) {
        out_buffer_ += ESC_RESET;
    }
    return Result::ok();
}

Result Terminal::flush() {
    if (!stream_) {
        out_buffer_.clear();
        return Result::fail(ErrorCode::OUTPUT_FAILURE, "terminal has no output stream");
    }

    if (!out_buffer_.empty()) {
        const size_t n = std::fwrite(out_buffer_.data(), 1, out_buffer_.size(), stream_);
        bytes_written_ += n;
        const bool short_write = n != out_buffer_.size();
        out_buffer_.clear();
        if (short_write) {
            return Result::fail(ErrorCode::OUTPUT_FAILURE,
                std::string("terminal write failed: ") + std::strerror(errno));
        }
    }

    if (std::fflush(stream_) != 0) {
        return Result::fail(ErrorCode::OUTPUT_FAILURE,
            std::string("terminal flush failed: ") + std::strerror(errno));
    }
    return Result::ok();
}

void Terminal::append_cursor_move(int row, int col) {
    out_buffer_.push_back('\033');
    out_buffer_.push_back('[');

    char tmp[16];
    auto row_res = std::to_chars(tmp, tmp + sizeof(tmp), row);
    if (row_res.ec == std::errc()) {
        out_buffer_.append(tmp, row_res.ptr);
    } else {
        out_buffer_.push_back('1');
    }

    out_buffer_.push_back(';');

    auto col_res = std::to_chars(tmp, tmp + sizeof(tmp), col);
    if (col_res.ec == std::errc()) {
        out_buffer_.append(tmp, col_res.ptr);
    } else {
        out_buffer_.push_back('1');
    }

    out_buffer_.push_back('H');
}

std::string Terminal::color_code(ColorMode mode, uint8_t r, uint8_t g, uint8_t b, bool fg) {
    char buf[32];
    switch (mode) {
        case ColorMode::None:
            return "";
        case ColorMode::Ansi16: {
            int idx = rgb_to_16(r, g, b);
            int base;
            int color_idx;
            if (idx < 8) {
                base = fg ? 30 : 40;
                color_idx = idx;
            } else {
                base = fg ? 90 : 100;
                color_idx = idx - 8;
            }
            std::snprintf(buf, sizeof(buf), "\033[%dm", base + color_idx);
            return buf;
        }
        case ColorMode::Ansi256: {
            int idx = rgb_to_256(r, g, b);
            std::snprintf(buf, sizeof(buf), fg ? "\033[38;5;%dm" : "\033[48;5;%dm", idx);
            return buf;
        }
        case ColorMode::Truecolor:
            std::snprintf(buf, sizeof(buf), fg ? "\033[38;2;%d;%d;%dm" : "\033[48;2;%d;%d;%dm", r, g, b);
            return buf;
    }
    return "";
}

uint8_t Terminal::rgb_to_256(uint8_t r, uint8_t g, uint8_t b) {
    uint8_t best_idx = 0;
    uint32_t best_dist = UINT32_MAX;

    for (int i = 0; i < 256; ++i) {
        int dr = r - color256_lookup.r[i];
        int dg = g - color256_lookup.g[i];
        int db = b - color256_lookup.b[i];
        uint32_t dist = static_cast<uint32_t>(dr*dr + dg*dg + db*db);
        if (dist < best_dist) {
            best_dist = dist;
            best_idx = static_cast<uint8_t>(i);
        }
    }

    return best_idx;
}

uint8_t Terminal::rgb_to_16(uint8_t r, uint8_t g, uint8_t b) {
    static const uint8_t palette[16][3] = {
        {0, 0, 0}, {128, 0, 0}, {0, 128, 0}, {128, 128, 0},
        {0, 0, 128}, {128, 0, 128}, {0, 128, 128}, {192, 192, 192},
        {128, 128, 128}, {255, 0, 0}, {0, 255, 0}, {255, 255, 0},
        {0, 0, 255}, {255, 0, 255}, {0, 255, 255}, {255, 255, 255}
    };

    uint8_t best_idx = 0;
    uint32_t best_dist = UINT32_MAX;

    for (int i = 0; i < 16; ++i) {
        int dr = r - palette[i][0];
        int dg = g - palette[i][1];
        int db = b - palette[i][2];
        uint32_t dist = static_cast<uint32_t>(dr*dr + dg*dg + db*db);
        if (dist < best_dist) {
            best_dist = dist;
            best_idx = static_cast<uint8_t>(i);
        }
    }

    return best_idx;
}

}
