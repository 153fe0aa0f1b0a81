#include "render/cell_writer.hpp"
#include "core/utf8.hpp"

namespace braille {

bool advances_one_column(uint32_t cp) {
    if (utf8::is_zero_width(cp)) return false;
    return cp < 0x1100 || is_braille_character(cp);
}

Result write_cell(OutputSink& out, const Cell& cell) {
    if (cell.has_color) {
        Result r = out.set_foreground(cell.color);
        if (r.failure()) return r;
    }

    Result r = out.write_char(cell.character());
    if (r.failure()) return r;

    if (cell.has_color) {
        return out.reset_colors();
    }
    return Result::ok();
}

Result draw_full(const DotGrid& grid, OutputSink& out, size_t* cells_written) {
    size_t written = 0;
    for (int y = 0; y < grid.height(); ++y) {
        Result r = out.move_cursor(y, 0);
        if (r.failure()) return r;

        for (int x = 0; x < grid.width(); ++x) {
            const Cell& cell = grid.cell(x, y);
            r = write_cell(out, cell);
            if (r.failure()) return r;
            ++written;

            if (x + 1 < grid.width() && !advances_one_column(cell.character())) {
                r = out.move_cursor(y, x + 1);
                if (r.failure()) return r;
            }
        }
    }

    if (cells_written) *cells_written = written;
    return Result::ok();
}

}
